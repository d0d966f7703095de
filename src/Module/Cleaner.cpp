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
 * Cleaner.cpp
 *
 * Normalizes and filters the raw reviews of a product.
 *
 *  Created on: Mar 8, 2021
 *      Author: ans
 */

#include "Cleaner.hpp"

#include <cmath>			// std::isfinite, std::lround
#include <unordered_set>	// std::unordered_set
#include <utility>			// std::move

namespace reviewlens::Module {

	//! Constructor.
	/*!
	 * \param minLength The minimum length of a
	 *   normalized review text, in characters.
	 */
	Cleaner::Cleaner(std::size_t minLength) : minTextLength(minLength) {}

	//! Cleans the raw reviews of a product.
	/*!
	 * Reviews with too short texts or invalid
	 *  ratings are dropped first. Afterwards,
	 *  reviews re-using the ID of an earlier
	 *  review are dropped, and then reviews
	 *  re-using the text of an earlier review.
	 *  The first occurence always wins.
	 *
	 * Unparseable dates are set to null, and
	 *  missing review IDs are replaced by the
	 *  product ID and the number of the row.
	 *
	 * \param source Constant reference to the
	 *   raw reviews of a product.
	 *
	 * \returns The cleaned reviews and the
	 *   counts collected while cleaning.
	 */
	CleanedReviews Cleaner::clean(const Struct::RawReviewSet& source) const {
		CleanedReviews result;

		result.productId = source.productId;
		result.counts.input = source.reviews.size();

		if(source.error.has_value()) {
			result.counts.unreadableSource = true;
			result.counts.sourceError = source.error;

			return result;
		}

		if(source.reviews.empty()) {
			result.counts.unreadableSource = true;
			result.counts.sourceError = "No reviews in " + source.source;

			return result;
		}

		std::unordered_set<std::string> ids;
		std::unordered_set<std::string> texts;

		for(const auto& raw : source.reviews) {
			// text
			auto text{Cleaner::normalizeText(raw.text.value_or(""))};

			if(Helper::Utf8::length(text) < this->minTextLength) {
				++result.counts.droppedShort;

				continue;
			}

			// rating
			const auto rating{Cleaner::parseRating(raw.rating.value_or(""))};

			if(!rating.has_value()) {
				++result.counts.droppedRating;

				continue;
			}

			// duplicates
			std::string id{raw.reviewId.value_or("")};

			Helper::Strings::trim(id);

			if(id.empty()) {
				id = Cleaner::makeReviewId(source.productId, raw.row);
			}

			if(!(ids.insert(id).second)) {
				++result.counts.droppedDuplicateId;

				continue;
			}

			if(!(texts.insert(text).second)) {
				++result.counts.droppedDuplicateText;

				continue;
			}

			// keep review
			Struct::Review review;

			review.reviewId = std::move(id);
			review.productId = source.productId;
			review.rating = rating.value();
			review.text = std::move(text);
			review.verified = Helper::Strings::stringToBool(raw.verified.value_or(""));
			review.date = Helper::DateTime::toIsoDate(raw.date.value_or(""));

			if(!review.date.has_value()) {
				++result.counts.nullDates;
			}

			result.reviews.emplace_back(std::move(review));
		}

		result.counts.kept = result.reviews.size();

		return result;
	}

	//! Normalizes the text of a review.
	/*!
	 * Repairs invalid UTF-8, removes control
	 *  characters, converts the text to lower
	 *  case, decodes common HTML entities,
	 *  replaces markup tags with spaces, replaces
	 *  typographic punctuation with ASCII,
	 *  collapses whitespaces and trims the result.
	 *
	 * Entities are decoded until none are left,
	 *  so that multiply encoded text like
	 *  @c &amp;amp;lt;3 is fully decoded in one
	 *  pass and normalizing the result again does
	 *  not change it.
	 *
	 * Sentence-ending punctuation is kept.
	 *
	 * \param text View of the text to normalize.
	 *
	 * \returns The normalized text.
	 */
	std::string Cleaner::normalizeText(std::string_view text) {
		std::string result;

		if(!Helper::Utf8::repairUtf8(text, result)) {
			result = text;
		}

		Helper::Strings::removeControlCharacters(result);
		Helper::Strings::toLower(result);

		std::string previous;

		do {
			previous = result;

			Helper::Strings::decodeHtmlEntities(result);
		} while(result != previous);

		Helper::Strings::stripHtmlTags(result);
		Helper::Strings::asciiPunctuation(result);
		Helper::Strings::utfTidy(result);

		return result;
	}

	//! Parses a rating.
	/*!
	 * Accepts numbers like @c 5, @c 5.0 or
	 *  @c " 4 ". Non-integral numbers are
	 *  rounded half away from zero.
	 *
	 * \param rating View of the string
	 *   containing the rating.
	 *
	 * \returns The rating, from one to five,
	 *   or an empty optional if the string
	 *   does not contain a number between one
	 *   and five.
	 */
	std::optional<std::uint8_t> Cleaner::parseRating(std::string_view rating) {
		std::string ratingCopy(rating);

		Helper::Strings::trim(ratingCopy);

		if(ratingCopy.empty()) {
			return std::nullopt;
		}

		double value{0.};

		try {
			value = boost::lexical_cast<double>(ratingCopy);
		}
		catch(const boost::bad_lexical_cast&) {
			return std::nullopt;
		}

		if(!std::isfinite(value) || value < minRating || value > maxRating) {
			return std::nullopt;
		}

		return static_cast<std::uint8_t>(std::lround(value));
	}

	//! Creates the ID of a review without ID from the ID of its product and its row.
	std::string Cleaner::makeReviewId(const std::string& productId, std::size_t row) {
		return productId + "-" + std::to_string(row);
	}

} /* namespace reviewlens::Module */
