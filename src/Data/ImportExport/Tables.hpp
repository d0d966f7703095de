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
 * Tables.hpp
 *
 * Namespace for importing the product table and raw reviews from CSV.
 *
 *  Created on: Mar 11, 2021
 *      Author: ans
 */

#ifndef DATA_IMPORTEXPORT_TABLES_HPP_
#define DATA_IMPORTEXPORT_TABLES_HPP_

#include "Csv.hpp"

#include "../../Helper/Strings.hpp"
#include "../../Main/Exception.hpp"
#include "../../Struct/Product.hpp"
#include "../../Struct/RawReview.hpp"

#include <cstddef>			// std::size_t
#include <map>				// std::map
#include <optional>			// std::optional, std::nullopt
#include <string>			// std::string, std::to_string
#include <string_view>		// std::string_view, std::string_view_literals
#include <unordered_set>	// std::unordered_set
#include <utility>			// std::move
#include <vector>			// std::vector

//! Namespace for importing the product table and raw reviews from CSV.
namespace reviewlens::Data::ImportExport::Tables {

	using std::string_view_literals::operator""sv;

	/*
	 * CONSTANTS
	 */

	///@name Constants
	///@{

	//! The prefix of the file names of per-product review files.
	inline constexpr auto reviewFilePrefix{"reviews_"sv};

	//! The extension of review files.
	inline constexpr auto reviewFileExtension{".csv"sv};

	///@}

	/*
	 * DECLARATION
	 */

	///@name Import
	///@{

	[[nodiscard]] std::vector<Struct::Product> importProducts(std::string_view content);
	[[nodiscard]] std::vector<Struct::RawReviewSet> importReviews(
			std::string_view content,
			const std::string& source,
			const std::string& defaultProductId
	);

	///@}
	///@name Helpers
	///@{

	[[nodiscard]] std::optional<std::string> getField(
			const Csv::Row& row,
			const std::optional<std::size_t>& column
	);
	[[nodiscard]] std::string productIdFromFileName(std::string_view fileName);

	///@}

	/*
	 * EXCEPTION CLASS
	 */

	//! Class for table exceptions.
	/*!
	 * Will be thrown when a mandatory
	 *  column is missing, or when the
	 *  product table contains an empty
	 *  or duplicate product ID.
	 */
	MAIN_EXCEPTION_CLASS();

	/*
	 * IMPLEMENTATION
	 */

	//! Imports the product table.
	/*!
	 * The first row needs to contain the names
	 *  of the columns. Only the column
	 *  @c product_id is mandatory. @c size_variant
	 *  is accepted instead of @c size.
	 *
	 * \param content View of the CSV content.
	 *
	 * \returns The products, in the order of the
	 *   table.
	 *
	 * \throws Tables::Exception if the column
	 *   @c product_id is missing, or a product
	 *   ID is empty or not unique.
	 * \throws Csv::Exception if the content is
	 *   not valid CSV.
	 */
	inline std::vector<Struct::Product> importProducts(std::string_view content) {
		const auto rows{Csv::importRows(content)};

		if(rows.empty()) {
			throw Exception("The product table is empty");
		}

		const auto& header{rows.front()};
		const auto idColumn{Csv::findColumn(header, {"product_id"sv})};

		if(!idColumn.has_value()) {
			throw Exception("The product table has no column 'product_id'");
		}

		const auto brandColumn{Csv::findColumn(header, {"brand"sv})};
		const auto nameColumn{Csv::findColumn(header, {"product_name"sv})};
		const auto flavorColumn{Csv::findColumn(header, {"flavor"sv})};
		const auto sizeColumn{Csv::findColumn(header, {"size"sv, "size_variant"sv})};
		const auto notesColumn{Csv::findColumn(header, {"notes"sv})};

		std::vector<Struct::Product> result;
		std::unordered_set<std::string> ids;

		for(std::size_t index{1}; index < rows.size(); ++index) {
			const auto& row{rows[index]};
			Struct::Product product;

			product.productId = getField(row, idColumn).value_or("");

			Helper::Strings::trim(product.productId);

			if(product.productId.empty()) {
				throw Exception(
						"Empty product ID in row #"
						+ std::to_string(index)
						+ " of the product table"
				);
			}

			if(!(ids.insert(product.productId).second)) {
				throw Exception(
						"Duplicate product ID '"
						+ product.productId
						+ "' in the product table"
				);
			}

			product.brand = getField(row, brandColumn).value_or("");
			product.productName = getField(row, nameColumn).value_or("");
			product.flavor = getField(row, flavorColumn).value_or("");
			product.size = getField(row, sizeColumn).value_or("");
			product.notes = getField(row, notesColumn).value_or("");

			result.emplace_back(std::move(product));
		}

		return result;
	}

	//! Imports raw reviews, grouped by product.
	/*!
	 * The first row needs to contain the names
	 *  of the columns. The following aliases
	 *  are accepted:
	 *  - @c reviewerID for @c review_id
	 *  - @c star_rating and @c overall for
	 *     @c rating
	 *  - @c review_body and @c reviewText for
	 *     @c text
	 *  - @c verified_purchase for @c verified
	 *  - @c review_date and @c reviewTime for
	 *     @c date
	 *
	 * Missing columns result in missing fields,
	 *  which will be handled while cleaning.
	 *
	 * \param content View of the CSV content.
	 * \param source Constant reference to a
	 *   string containing the name of the
	 *   source of the content, e.g. its file
	 *   name.
	 * \param defaultProductId Constant reference
	 *   to the ID of the product used for rows
	 *   without product ID, or an empty string
	 *   if every row needs to contain a product
	 *   ID.
	 *
	 * \returns The raw reviews, grouped by
	 *   product and sorted by product ID. Rows
	 *   are numbered per product, starting
	 *   with one.
	 *
	 * \throws Tables::Exception if there is no
	 *   column @c product_id and no default
	 *   product ID has been given.
	 * \throws Csv::Exception if the content is
	 *   not valid CSV.
	 */
	inline std::vector<Struct::RawReviewSet> importReviews(
			std::string_view content,
			const std::string& source,
			const std::string& defaultProductId
	) {
		const auto rows{Csv::importRows(content)};
		std::map<std::string, Struct::RawReviewSet> sets;

		if(!defaultProductId.empty()) {
			// the set exists even if the source contains no reviews
			auto& set{sets[defaultProductId]};

			set.productId = defaultProductId;
			set.source = source;
		}

		if(rows.empty()) {
			std::vector<Struct::RawReviewSet> result;

			for(auto& [id, set] : sets) {
				result.emplace_back(std::move(set));
			}

			return result;
		}

		const auto& header{rows.front()};
		const auto productColumn{Csv::findColumn(header, {"product_id"sv})};

		if(!productColumn.has_value() && defaultProductId.empty()) {
			throw Exception("'" + source + "' has no column 'product_id'");
		}

		const auto idColumn{Csv::findColumn(header, {"review_id"sv, "reviewerID"sv})};
		const auto ratingColumn{Csv::findColumn(header, {"rating"sv, "star_rating"sv, "overall"sv})};
		const auto textColumn{Csv::findColumn(header, {"text"sv, "review_body"sv, "reviewText"sv})};
		const auto verifiedColumn{Csv::findColumn(header, {"verified"sv, "verified_purchase"sv})};
		const auto dateColumn{Csv::findColumn(header, {"date"sv, "review_date"sv, "reviewTime"sv})};

		for(std::size_t index{1}; index < rows.size(); ++index) {
			const auto& row{rows[index]};
			auto productId{getField(row, productColumn).value_or("")};

			Helper::Strings::trim(productId);

			if(productId.empty()) {
				productId = defaultProductId;
			}

			auto& set{sets[productId]};

			if(set.reviews.empty()) {
				set.productId = productId;
				set.source = source;
			}

			Struct::RawReview review;

			review.row = set.reviews.size() + 1;
			review.reviewId = getField(row, idColumn);
			review.rating = getField(row, ratingColumn);
			review.text = getField(row, textColumn);
			review.verified = getField(row, verifiedColumn);
			review.date = getField(row, dateColumn);

			set.reviews.emplace_back(std::move(review));
		}

		std::vector<Struct::RawReviewSet> result;

		result.reserve(sets.size());

		for(auto& [id, set] : sets) {
			result.emplace_back(std::move(set));
		}

		return result;
	}

	//! Gets a field from a row, if the column exists.
	/*!
	 * \returns The value of the field, or an
	 *   empty optional if the column does not
	 *   exist, or the row is too short.
	 */
	inline std::optional<std::string> getField(
			const Csv::Row& row,
			const std::optional<std::size_t>& column
	) {
		if(!column.has_value() || column.value() >= row.size()) {
			return std::nullopt;
		}

		return row[column.value()];
	}

	//! Gets the product ID from the name of a per-product review file.
	/*!
	 * \param fileName View of the file name,
	 *   e.g. @c reviews_B000123.csv.
	 *
	 * \returns The product ID, e.g. @c B000123,
	 *   or an empty string if the file name
	 *   does not follow the naming scheme.
	 */
	inline std::string productIdFromFileName(std::string_view fileName) {
		if(
				fileName.length() <= reviewFilePrefix.length() + reviewFileExtension.length()
				|| fileName.substr(0, reviewFilePrefix.length()) != reviewFilePrefix
				|| fileName.substr(fileName.length() - reviewFileExtension.length()) != reviewFileExtension
		) {
			return std::string{};
		}

		fileName.remove_prefix(reviewFilePrefix.length());
		fileName.remove_suffix(reviewFileExtension.length());

		return std::string(fileName);
	}

} /* namespace reviewlens::Data::ImportExport::Tables */

#endif /* DATA_IMPORTEXPORT_TABLES_HPP_ */
