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
 * Results.hpp
 *
 * Namespace for exporting the results of a pipeline run to CSV and JSON.
 *
 *  Created on: Mar 12, 2021
 *      Author: ans
 */

#ifndef DATA_IMPORTEXPORT_RESULTS_HPP_
#define DATA_IMPORTEXPORT_RESULTS_HPP_

#include "Csv.hpp"

#include "../../Helper/Json.hpp"
#include "../../Helper/Math.hpp"
#include "../../Helper/Strings.hpp"
#include "../../Struct/ComparisonRecord.hpp"
#include "../../Struct/KeywordEntry.hpp"
#include "../../Struct/Product.hpp"
#include "../../Struct/Review.hpp"
#include "../../Struct/Sentiment.hpp"
#include "../../Struct/Summary.hpp"

#include <rapidjson/document.h>

#include <array>		// std::array
#include <cstddef>		// std::size_t
#include <cstdint>		// std::uint64_t
#include <iomanip>		// std::setprecision
#include <ios>			// std::fixed
#include <locale>		// std::locale
#include <map>			// std::map
#include <optional>		// std::optional
#include <sstream>		// std::ostringstream
#include <string>		// std::string, std::to_string
#include <string_view>	// std::string_view_literals
#include <vector>		// std::vector

//! Namespace for exporting the results of a pipeline run to CSV and JSON.
namespace reviewlens::Data::ImportExport::Results {

	using std::string_view_literals::operator""sv;

	/*
	 * CONSTANTS
	 */

	///@name Constants
	///@{

	//! The number of decimals of sentiment scores.
	inline constexpr auto sentimentDecimals{4};

	//! The number of decimals of keyword scores.
	inline constexpr auto keywordDecimals{6};

	//! The number of decimals of percentages and averages.
	inline constexpr auto percentageDecimals{2};

	//! The separator between a keyword and its score in a flattened keyword list.
	inline constexpr auto keywordScoreSeparator{':'};

	//! The separator between keywords in a flattened keyword list.
	inline constexpr auto keywordSeparator{';'};

	//! The columns of the cleaned and labeled reviews.
	inline constexpr std::array reviewColumns{
		"review_id"sv,
		"product_id"sv,
		"rating"sv,
		"text"sv,
		"verified"sv,
		"date"sv,
		"sentiment_score"sv,
		"sentiment_label"sv
	};

	//! The columns of the keyword table.
	inline constexpr std::array keywordColumns{
		"product_id"sv,
		"bucket"sv,
		"rank"sv,
		"term"sv,
		"score"sv
	};

	///@}

	/*
	 * DECLARATION
	 */

	///@name Export
	///@{

	[[nodiscard]] std::string exportReviews(const std::vector<Struct::Review>& reviews);
	[[nodiscard]] std::string exportKeywordsCsv(const std::vector<Struct::KeywordEntry>& keywords);
	[[nodiscard]] std::string exportKeywordsJson(
			const std::vector<Struct::Product>& products,
			const std::vector<Struct::KeywordEntry>& keywords
	);
	[[nodiscard]] std::string exportComparisonCsv(const std::vector<Struct::ComparisonRecord>& records);
	[[nodiscard]] std::string exportComparisonJson(const std::vector<Struct::ComparisonRecord>& records);
	[[nodiscard]] std::string exportSummary(
			const std::vector<Struct::CleaningCounts>& cleaning,
			const std::vector<Struct::Product>& products,
			const std::vector<Struct::StageSummary>& stages
	);

	///@}
	///@name Formatting
	///@{

	[[nodiscard]] std::string formatNumber(double number, int decimals);
	[[nodiscard]] std::string formatNullable(const std::optional<double>& number, int decimals);
	[[nodiscard]] std::string flattenKeywords(const std::vector<Struct::RecordKeyword>& keywords);

	///@}

	/*
	 * IMPLEMENTATION
	 */

	/*
	 * EXPORT
	 */

	//! Exports cleaned and labeled reviews to CSV.
	/*!
	 * Missing dates and sentiment scores or
	 *  labels are exported as empty fields.
	 */
	inline std::string exportReviews(const std::vector<Struct::Review>& reviews) {
		std::string result;

		Csv::exportRow(Csv::Row(reviewColumns.begin(), reviewColumns.end()), result);

		for(const auto& review : reviews) {
			Csv::exportRow(
					{
							review.reviewId,
							review.productId,
							std::to_string(review.rating),
							review.text,
							review.verified ? "true" : "false",
							review.date.value_or(""),
							formatNullable(review.sentimentScore, sentimentDecimals),
							review.sentimentLabel.has_value() ?
									std::string(Struct::toString(review.sentimentLabel.value()))
									: std::string{}
					},
					result
			);
		}

		return result;
	}

	//! Exports the keyword table to CSV.
	inline std::string exportKeywordsCsv(const std::vector<Struct::KeywordEntry>& keywords) {
		std::string result;

		Csv::exportRow(Csv::Row(keywordColumns.begin(), keywordColumns.end()), result);

		for(const auto& keyword : keywords) {
			Csv::exportRow(
					{
							keyword.productId,
							std::string(Struct::toString(keyword.bucket)),
							std::to_string(keyword.rank),
							keyword.term,
							formatNumber(keyword.score, keywordDecimals)
					},
					result
			);
		}

		return result;
	}

	//! Exports the keyword table to JSON.
	/*!
	 * Creates one object per product of the
	 *  product table, containing an array of
	 *  keywords for each bucket. Empty
	 *  buckets are exported as empty arrays.
	 *
	 * \param products Constant reference to a
	 *   vector containing the product table.
	 * \param keywords Constant reference to a
	 *   vector containing the keyword table.
	 *   Keywords of other products will be
	 *   ignored.
	 *
	 * \returns The indented JSON code.
	 */
	inline std::string exportKeywordsJson(
			const std::vector<Struct::Product>& products,
			const std::vector<Struct::KeywordEntry>& keywords
	) {
		rapidjson::Document document(rapidjson::kObjectType);
		auto& allocator{document.GetAllocator()};
		std::map<std::string, std::vector<const Struct::KeywordEntry *>> byProduct;

		for(const auto& keyword : keywords) {
			byProduct[keyword.productId].push_back(&keyword);
		}

		for(const auto& product : products) {
			rapidjson::Value buckets(rapidjson::kObjectType);

			for(const auto bucket : Struct::allBuckets) {
				rapidjson::Value terms(rapidjson::kArrayType);

				for(const auto * keyword : byProduct[product.productId]) {
					if(keyword->bucket != bucket) {
						continue;
					}

					rapidjson::Value term(rapidjson::kObjectType);

					Helper::Json::addMember(term, "term", Helper::Json::makeString(keyword->term, allocator), allocator);
					Helper::Json::addMember(
							term,
							"score",
							rapidjson::Value(Helper::Math::round(keyword->score, keywordDecimals)),
							allocator
					);
					Helper::Json::addMember(
							term,
							"rank",
							rapidjson::Value(static_cast<std::uint64_t>(keyword->rank)),
							allocator
					);

					terms.PushBack(term, allocator);
				}

				Helper::Json::addMember(buckets, Struct::toString(bucket), terms, allocator);
			}

			Helper::Json::addMember(document, product.productId, buckets, allocator);
		}

		return Helper::Json::prettify(document);
	}

	//! Exports the comparison table to CSV.
	/*!
	 * Keyword lists are flattened into
	 *  @c term:score pairs separated by
	 *  semicolons.
	 */
	inline std::string exportComparisonCsv(const std::vector<Struct::ComparisonRecord>& records) {
		std::string result;
		Csv::Row header{
			"product_id",
			"display_name",
			"brand",
			"product_name",
			"flavor",
			"size",
			"notes",
			"review_count"
		};

		for(std::size_t rating{1}; rating <= Struct::numRatings; ++rating) {
			header.emplace_back("rating_" + std::to_string(rating));
		}

		for(std::size_t rating{1}; rating <= Struct::numRatings; ++rating) {
			header.emplace_back("rating_pct_" + std::to_string(rating));
		}

		for(const auto * column : {
				"avg_rating",
				"pct_positive",
				"pct_neutral",
				"pct_negative",
				"pct_verified",
				"avg_length",
				"score"
		}) {
			header.emplace_back(column);
		}

		for(const auto bucket : Struct::allBuckets) {
			header.emplace_back("keywords_" + std::string(Struct::toString(bucket)));
		}

		Csv::exportRow(header, result);

		for(const auto& record : records) {
			Csv::Row row{
				record.product.productId,
				record.product.displayName(),
				record.product.brand,
				record.product.productName,
				record.product.flavor,
				record.product.size,
				record.product.notes,
				std::to_string(record.reviewCount)
			};

			for(const auto count : record.ratingDistribution) {
				row.emplace_back(std::to_string(count));
			}

			for(const auto& percentage : record.ratingPercentages) {
				row.emplace_back(formatNullable(percentage, percentageDecimals));
			}

			for(const auto * value : {
					&record.avgRating,
					&record.pctPositive,
					&record.pctNeutral,
					&record.pctNegative,
					&record.pctVerified,
					&record.avgLength,
					&record.score
			}) {
				row.emplace_back(formatNullable(*value, percentageDecimals));
			}

			for(const auto& keywords : record.keywords) {
				row.emplace_back(flattenKeywords(keywords));
			}

			Csv::exportRow(row, result);
		}

		return result;
	}

	//! Exports the comparison table to JSON.
	/*!
	 * \returns The indented JSON code of an
	 *   array containing one object per
	 *   record, with nested rating
	 *   distributions and keyword lists.
	 */
	inline std::string exportComparisonJson(const std::vector<Struct::ComparisonRecord>& records) {
		rapidjson::Document document(rapidjson::kArrayType);
		auto& allocator{document.GetAllocator()};

		for(const auto& record : records) {
			rapidjson::Value object(rapidjson::kObjectType);
			rapidjson::Value distribution(rapidjson::kObjectType);
			rapidjson::Value percentages(rapidjson::kObjectType);
			rapidjson::Value keywords(rapidjson::kObjectType);

			const auto addString{
				[&object, &allocator](std::string_view key, std::string_view value) {
					Helper::Json::addMember(object, key, Helper::Json::makeString(value, allocator), allocator);
				}
			};

			const auto addNullable{
				[&object, &allocator](std::string_view key, const std::optional<double>& value) {
					Helper::Json::addMember(object, key, Helper::Json::makeNullable(value), allocator);
				}
			};

			addString("product_id", record.product.productId);
			addString("display_name", record.product.displayName());
			addString("brand", record.product.brand);
			addString("product_name", record.product.productName);
			addString("flavor", record.product.flavor);
			addString("size", record.product.size);
			addString("notes", record.product.notes);

			Helper::Json::addMember(
					object,
					"review_count",
					rapidjson::Value(static_cast<std::uint64_t>(record.reviewCount)),
					allocator
			);

			for(std::size_t index{0}; index < record.ratingDistribution.size(); ++index) {
				const auto key{std::to_string(index + 1)};

				Helper::Json::addMember(
						distribution,
						key,
						rapidjson::Value(static_cast<std::uint64_t>(record.ratingDistribution[index])),
						allocator
				);
				Helper::Json::addMember(
						percentages,
						key,
						Helper::Json::makeNullable(record.ratingPercentages[index]),
						allocator
				);
			}

			Helper::Json::addMember(object, "rating_distribution", distribution, allocator);
			Helper::Json::addMember(object, "rating_pct", percentages, allocator);

			addNullable("avg_rating", record.avgRating);
			addNullable("pct_positive", record.pctPositive);
			addNullable("pct_neutral", record.pctNeutral);
			addNullable("pct_negative", record.pctNegative);
			addNullable("pct_verified", record.pctVerified);
			addNullable("avg_length", record.avgLength);
			addNullable("score", record.score);

			for(const auto bucket : Struct::allBuckets) {
				rapidjson::Value terms(rapidjson::kArrayType);

				for(const auto& [term, score] : record.keywords[static_cast<std::size_t>(bucket)]) {
					rapidjson::Value pair(rapidjson::kObjectType);

					Helper::Json::addMember(pair, "term", Helper::Json::makeString(term, allocator), allocator);
					Helper::Json::addMember(
							pair,
							"score",
							rapidjson::Value(Helper::Math::round(score, keywordDecimals)),
							allocator
					);

					terms.PushBack(pair, allocator);
				}

				Helper::Json::addMember(keywords, Struct::toString(bucket), terms, allocator);
			}

			Helper::Json::addMember(object, "keywords", keywords, allocator);

			document.PushBack(object, allocator);
		}

		return Helper::Json::prettify(document);
	}

	//! Exports the summary of a pipeline run to JSON.
	/*!
	 * \param cleaning Constant reference to a
	 *   vector containing the counts of the
	 *   cleaning stage, in the order of the
	 *   product table.
	 * \param products Constant reference to a
	 *   vector containing the product table.
	 * \param stages Constant reference to a
	 *   vector containing the summaries of
	 *   all stages.
	 *
	 * \returns The indented JSON code.
	 */
	inline std::string exportSummary(
			const std::vector<Struct::CleaningCounts>& cleaning,
			const std::vector<Struct::Product>& products,
			const std::vector<Struct::StageSummary>& stages
	) {
		rapidjson::Document document(rapidjson::kObjectType);
		auto& allocator{document.GetAllocator()};
		rapidjson::Value cleaningArray(rapidjson::kArrayType);
		rapidjson::Value stagesArray(rapidjson::kArrayType);

		const auto makeCount{
			[](std::uint64_t count) {
				return rapidjson::Value(static_cast<std::uint64_t>(count));
			}
		};

		for(std::size_t index{0}; index < cleaning.size() && index < products.size(); ++index) {
			const auto& counts{cleaning[index]};
			rapidjson::Value object(rapidjson::kObjectType);

			Helper::Json::addMember(
					object,
					"product_id",
					Helper::Json::makeString(products[index].productId, allocator),
					allocator
			);
			Helper::Json::addMember(object, "input", makeCount(counts.input), allocator);
			Helper::Json::addMember(object, "kept", makeCount(counts.kept), allocator);
			Helper::Json::addMember(object, "dropped_short", makeCount(counts.droppedShort), allocator);
			Helper::Json::addMember(object, "dropped_rating", makeCount(counts.droppedRating), allocator);
			Helper::Json::addMember(object, "dropped_duplicate_id", makeCount(counts.droppedDuplicateId), allocator);
			Helper::Json::addMember(object, "dropped_duplicate_text", makeCount(counts.droppedDuplicateText), allocator);
			Helper::Json::addMember(object, "null_dates", makeCount(counts.nullDates), allocator);
			Helper::Json::addMember(object, "unreadable_source", rapidjson::Value(counts.unreadableSource), allocator);
			Helper::Json::addMember(
					object,
					"source_error",
					Helper::Json::makeNullable(counts.sourceError, allocator),
					allocator
			);

			cleaningArray.PushBack(object, allocator);
		}

		for(const auto& stage : stages) {
			rapidjson::Value object(rapidjson::kObjectType);
			rapidjson::Value productsArray(rapidjson::kArrayType);
			rapidjson::Value orphans(rapidjson::kObjectType);

			for(const auto& [productId, counts] : stage.products) {
				rapidjson::Value product(rapidjson::kObjectType);

				Helper::Json::addMember(product, "product_id", Helper::Json::makeString(productId, allocator), allocator);
				Helper::Json::addMember(product, "kept", makeCount(counts.kept), allocator);
				Helper::Json::addMember(product, "dropped", makeCount(counts.dropped), allocator);

				productsArray.PushBack(product, allocator);
			}

			for(const auto& [productId, count] : stage.orphans) {
				Helper::Json::addMember(orphans, productId, makeCount(count), allocator);
			}

			Helper::Json::addMember(object, "stage", Helper::Json::makeString(stage.stage, allocator), allocator);
			Helper::Json::addMember(object, "products", productsArray, allocator);
			Helper::Json::addMember(object, "orphans", orphans, allocator);

			stagesArray.PushBack(object, allocator);
		}

		Helper::Json::addMember(document, "cleaning", cleaningArray, allocator);
		Helper::Json::addMember(document, "stages", stagesArray, allocator);

		return Helper::Json::prettify(document);
	}

	/*
	 * FORMATTING
	 */

	//! Formats a number with a fixed number of decimals.
	/*!
	 * The number is rounded half away from
	 *  zero first. Negative zero is formatted
	 *  without sign. The decimal point is
	 *  always a dot, independent of the global
	 *  locale.
	 */
	inline std::string formatNumber(double number, int decimals) {
		std::ostringstream out;

		out.imbue(std::locale::classic());

		out << std::fixed << std::setprecision(decimals) << Helper::Math::round(number, decimals);

		return out.str();
	}

	//! Formats a number with a fixed number of decimals, or returns an empty string if there is none.
	inline std::string formatNullable(const std::optional<double>& number, int decimals) {
		if(number.has_value()) {
			return formatNumber(number.value(), decimals);
		}

		return std::string{};
	}

	//! Flattens a keyword list into @c term:score pairs separated by semicolons.
	inline std::string flattenKeywords(const std::vector<Struct::RecordKeyword>& keywords) {
		std::vector<std::string> entries;

		entries.reserve(keywords.size());

		for(const auto& [term, score] : keywords) {
			entries.emplace_back(term);

			entries.back().push_back(keywordScoreSeparator);

			entries.back() += formatNumber(score, keywordDecimals);
		}

		return Helper::Strings::join(entries, std::string_view(&keywordSeparator, 1), false);
	}

} /* namespace reviewlens::Data::ImportExport::Results */

#endif /* DATA_IMPORTEXPORT_RESULTS_HPP_ */
