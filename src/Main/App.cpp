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
 * App.cpp
 *
 * The main application class.
 *
 *  Created on: Mar 13, 2021
 *      Author: ans
 */

#include "App.hpp"

namespace reviewlens::Main {

	//! Constructor.
	/*!
	 * Writes the application header to @c stdout,
	 *  checks the program arguments and loads the
	 *  configuration from the configuration file.
	 *
	 * \param args Constant reference to a vector
	 *   containing the program arguments passed
	 *   to the application, e.g. via the command
	 *   line.
	 */
	App::App(const std::vector<std::string>& args) noexcept {
		try {
			// check number of arguments
			App::checkArgumentNumber(args.size());

			// check argument
			if(args.at(1) == "-v") {
				this->showVersionsOnly = true;
			}

			// show header
			App::outputHeader(this->showVersionsOnly);

			if(this->showVersionsOnly) {
				return;
			}

			// load configuration file
			App::loadConfig(args.at(1), this->settings);

			this->ready = true;
		}
		catch(const std::exception& e) {
			std::cout << "[ERROR] " << e.what() << std::endl;
		}
	}

	//! Runs the application.
	/*!
	 * Runs the pipeline, writes its results
	 *  and shows a summary of the comparison
	 *  table.
	 *
	 * \returns EXIT_SUCCESS on success,
	 *   EXIT_FAILURE on failure.
	 */
	int App::run() noexcept {
		if(this->showVersionsOnly) {
			return EXIT_SUCCESS;
		}

		if(!(this->ready)) {
			return EXIT_FAILURE;
		}

		try {
			StatusSetter statusSetter(this->settings.verbose, App::log);
			Module::Pipeline pipeline(this->settings, statusSetter);

			const auto result{pipeline.run()};

			pipeline.write(result);

			App::outputSummary(result);

			return EXIT_SUCCESS;
		}
		catch(const std::exception& e) {
			std::cout << "[ERROR] " << e.what() << std::endl;
		}

		return EXIT_FAILURE;
	}

	//! Loads the settings of the pipeline from a configuration file.
	/*!
	 * Entries that are not set in the
	 *  configuration file keep their
	 *  default values.
	 *
	 * \param fileName Constant reference to a
	 *   string containing the name of the
	 *   configuration file.
	 * \param settingsTo Reference to the settings
	 *   to which the configuration will be
	 *   written.
	 *
	 * \throws ConfigFile::Exception if the file
	 *   could not be read, or a value could not
	 *   be converted.
	 */
	void App::loadConfig(const std::string& fileName, PipelineSettings& settingsTo) {
		// read file
		const ConfigFile configFile(fileName);

		// input and output
		configFile.getValue("products", settingsTo.products);
		configFile.getValue("reviews", settingsTo.reviews);
		configFile.getValue("output_dir", settingsTo.outputDir);
		configFile.getValue("sentiment_dictionary", settingsTo.sentimentDictionary);
		configFile.getValue("sentiment_emojis", settingsTo.sentimentEmojis);
		configFile.getValue("write_clean", settingsTo.writeClean);

		// cleaning
		configFile.getValue("min_length", settingsTo.minLength);

		// keywords
		configFile.getValue("min_df", settingsTo.minDf);
		configFile.getValue("top_k", settingsTo.topK);
		configFile.getValue("max_features", settingsTo.maxFeatures);
		configFile.getValue("ngram_max", settingsTo.nGramMax);
		configFile.getList("extra_stopwords", settingsTo.extraStopwords);
		configFile.getValue("extra_stopwords_file", settingsTo.extraStopwordsFile);
		configFile.getValue("filter_all_brands", settingsTo.filterAllBrands);

		// aggregation
		configFile.getValue("record_keywords", settingsTo.recordKeywords);

		// execution
		configFile.getValue("threads", settingsTo.threads);
		configFile.getValue("verbose", settingsTo.verbose);
	}

	// static helper function: show version (and library versions if necessary)
	void App::outputHeader(bool showLibraryVersions) {
		std::cout
				<< descName << "\n"
				<< descVer << Version::getString() << "\n\n"
				<< descCopyrightHead << year << descCopyrightTail << "\n\n"
				<< descLicense << "\n";

		if(showLibraryVersions) {
			std::cout
					<< "\n" << descUsing << "\n"
					<< Helper::Versions::getLibraryVersionsStr("\t");
		}

		std::cout << std::endl;
	}

	// static helper function: show the comparison table
	void App::outputSummary(const PipelineResult& result) {
		const auto number{
			[](const std::optional<double>& value) {
				if(value.has_value()) {
					return Data::ImportExport::Results::formatNumber(value.value(), tableDecimals);
				}

				return std::string{"-"};
			}
		};

		std::cout
				<< "\n"
				<< std::left << std::setw(tableProductWidth) << "PRODUCT"
				<< std::right << std::setw(tableNumberWidth) << "REVIEWS"
				<< std::setw(tableNumberWidth) << "RATING"
				<< std::setw(tableNumberWidth) << "POS %"
				<< std::setw(tableNumberWidth) << "NEU %"
				<< std::setw(tableNumberWidth) << "NEG %"
				<< std::setw(tableNumberWidth) << "SCORE"
				<< "\n";

		for(const auto& record : result.comparison) {
			std::cout
					<< std::left << std::setw(tableProductWidth) << record.product.displayName()
					<< std::right << std::setw(tableNumberWidth) << record.reviewCount
					<< std::setw(tableNumberWidth) << number(record.avgRating)
					<< std::setw(tableNumberWidth) << number(record.pctPositive)
					<< std::setw(tableNumberWidth) << number(record.pctNeutral)
					<< std::setw(tableNumberWidth) << number(record.pctNegative)
					<< std::setw(tableNumberWidth) << number(record.score)
					<< "\n";
		}

		std::cout << std::flush;
	}

	// static helper function: write a log message to stdout
	void App::log(LogLevel level, const std::string& message) {
		std::cout << Struct::logPrefix(level) << message << std::endl;
	}

	// static helper function: check number of command line arguments, throws Main::Exception
	void App::checkArgumentNumber(std::size_t args) {
		if(args != argsRequired) {
			throw Exception(descUsage);
		}
	}

} /* namespace reviewlens::Main */
