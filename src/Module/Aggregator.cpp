/*
 *
 * ---
 *
 *  Copyright (C) 2021 Anselm Schmidt (ans[ät]ohai.su)
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation, either version 3 of the License, or
 *  (at your option) any later version in addition to the terms of any
 *  licences already herein identified.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with this program. If not, see <https://www.gnu.org/licenses/>.
 *
 * ---
 *
 * Aggregator.cpp
 *
 * Joins reviews, keywords and product metadata into the comparison table.
 *
 *  Created on: Mar 10, 2021
 *      Author: ans
 */

#include "Aggregator.hpp"

#include "ProductGroups.hpp"

#include "../Helper/Math.hpp"
#include "../Helper/Utf8.hpp"

#include <algorithm>	// std::sort, std::stable_sort
#include <array>		// std::array
#include <cstdint>		// std::uint64_t
#include <map>			// std::map
#include <string>		// std::string
#include <utility>		// std::move

namespace reviewlens::Module {

	//! Constructor.
	/*!
	 * \param recordKeywords The maximum number
	 *   of keywords per bucket to be nested
	 *   on each record.
	 */
	Aggregator::Aggregator(std::size_t recordKeywords) : keywordsPerBucket(recordKeywords) {}

	//! Creates the comparison record of a product.
	/*!
	 * \param product Constant reference to the
	 *   product.
	 * \param reviews Constant reference to a
	 *   vector containing the labeled reviews
	 *   of the product.
	 * \param keywords Constant reference to a
	 *   vector containing keywords. Keywords
	 *   of other products will be ignored.
	 *
	 * \returns The comparison record. All
	 *   percentages and averages, as well as
	 *   the score, are null if the product has
	 *   no reviews.
	 */
	Struct::ComparisonRecord Aggregator::aggregate(
			const Struct::Product& product,
			const std::vector<Struct::Review>& reviews,
			const std::vector<Struct::KeywordEntry>& keywords
	) const {
		Struct::ComparisonRecord record;

		record.product = product;
		record.reviewCount = reviews.size();

		std::array<std::uint64_t, Struct::numBuckets> labels{};
		std::uint64_t verified{0};
		std::uint64_t ratingSum{0};
		std::uint64_t lengthSum{0};

		for(const auto& review : reviews) {
			if(review.rating >= 1 && review.rating <= Struct::numRatings) {
				++record.ratingDistribution[review.rating - 1];
			}

			if(review.sentimentLabel.has_value()) {
				++labels[static_cast<std::size_t>(Struct::toBucket(review.sentimentLabel.value()))];
			}

			if(review.verified) {
				++verified;
			}

			ratingSum += review.rating;
			lengthSum += Helper::Utf8::length(review.text);
		}

		for(std::size_t index{0}; index < record.ratingDistribution.size(); ++index) {
			record.ratingPercentages[index] = Helper::Math::percentage(
					record.ratingDistribution[index],
					record.reviewCount,
					aggregateDecimals
			);
		}

		const auto labelPercentage{
			[&labels, &record](Struct::Bucket bucket) {
				return Helper::Math::percentage(
						labels[static_cast<std::size_t>(bucket)],
						record.reviewCount,
						aggregateDecimals
				);
			}
		};

		record.pctPositive = labelPercentage(Struct::Bucket::positive);
		record.pctNeutral = labelPercentage(Struct::Bucket::neutral);
		record.pctNegative = labelPercentage(Struct::Bucket::negative);
		record.pctVerified = Helper::Math::percentage(verified, record.reviewCount, aggregateDecimals);

		if(record.reviewCount > 0) {
			const auto count{static_cast<double>(record.reviewCount)};

			record.avgRating = Helper::Math::round(static_cast<double>(ratingSum) / count, aggregateDecimals);
			record.avgLength = Helper::Math::round(static_cast<double>(lengthSum) / count, aggregateDecimals);

			// computed from the rounded percentages
			record.score = Helper::Math::round(
					record.pctPositive.value() - record.pctNegative.value(),
					aggregateDecimals
			);

			std::vector<const Struct::KeywordEntry *> ofProduct;

			for(const auto& keyword : keywords) {
				if(keyword.productId == product.productId && keyword.rank <= this->keywordsPerBucket) {
					ofProduct.push_back(&keyword);
				}
			}

			std::stable_sort(
					ofProduct.begin(),
					ofProduct.end(),
					[](const auto * keyword1, const auto * keyword2) {
						return keyword1->rank < keyword2->rank;
					}
			);

			for(const auto * keyword : ofProduct) {
				record.keywords[static_cast<std::size_t>(keyword->bucket)].emplace_back(
						keyword->term,
						keyword->score
				);
			}
		}

		return record;
	}

	//! Creates the sorted comparison table of all products in the product table.
	/*!
	 * \param products Constant reference to a
	 *   vector containing the product table.
	 * \param reviews Constant reference to a
	 *   vector containing the labeled reviews
	 *   of all products.
	 * \param keywords Constant reference to a
	 *   vector containing the keywords of all
	 *   products.
	 * \param summaryTo Reference to the summary
	 *   of the stage, to which the number of
	 *   aggregated reviews per product and the
	 *   orphaned reviews will be written.
	 *
	 * \returns The comparison table, sorted by
	 *   descending score.
	 *
	 * \sa sort
	 */
	std::vector<Struct::ComparisonRecord> Aggregator::aggregateAll(
			const std::vector<Struct::Product>& products,
			const std::vector<Struct::Review>& reviews,
			const std::vector<Struct::KeywordEntry>& keywords,
			Struct::StageSummary& summaryTo
	) const {
		auto groups{groupByProduct(products, reviews)};
		std::map<std::string, std::vector<Struct::KeywordEntry>> keywordsByProduct;
		const std::vector<Struct::KeywordEntry> none;
		std::vector<Struct::ComparisonRecord> result;

		for(const auto& keyword : keywords) {
			keywordsByProduct[keyword.productId].push_back(keyword);
		}

		summaryTo.orphans = std::move(groups.orphans);

		result.reserve(products.size());

		for(std::size_t index{0}; index < products.size(); ++index) {
			const auto& product{products[index]};
			const auto it{keywordsByProduct.find(product.productId)};
			Struct::StageCounts counts;

			counts.kept = groups.reviews[index].size();

			summaryTo.products.emplace_back(product.productId, counts);

			result.emplace_back(
					this->aggregate(
							product,
							groups.reviews[index],
							it == keywordsByProduct.end() ? none : it->second
					)
			);
		}

		Aggregator::sort(result);

		return result;
	}

	//! Sorts comparison records by descending score.
	/*!
	 * Records without score follow all
	 *  records with score. Records with
	 *  the same score are sorted by the
	 *  ID of their product.
	 */
	void Aggregator::sort(std::vector<Struct::ComparisonRecord>& records) {
		std::sort(records.begin(), records.end(), Aggregator::isBefore);
	}

	//! Checks whether a comparison record needs to be sorted before another one.
	bool Aggregator::isBefore(
			const Struct::ComparisonRecord& record1,
			const Struct::ComparisonRecord& record2
	) {
		if(record1.score.has_value() != record2.score.has_value()) {
			return record1.score.has_value();
		}

		if(record1.score.has_value() && record1.score.value() != record2.score.value()) {
			return record1.score.value() > record2.score.value();
		}

		return record1.product.productId < record2.product.productId;
	}

} /* namespace reviewlens::Module */
