#pragma once

#include "campus-energy/ingest/row_source.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace campusenergy::ingest {

/**
 * @class CsvRowSource
 * @brief Reads meter rows from one comma-separated file with a header line.
 *
 * The `Date` and `KWH` columns are required; `Building` is optional and
 * other columns are ignored. A line with more fields than the header is
 * skipped as malformed; a line with fewer fields leaves the missing trailing
 * fields absent. Blank lines are ignored. The origin label is the file name
 * without extension.
 */
class CsvRowSource final : public IRowSource {
public:
	explicit CsvRowSource(std::filesystem::path path);

	const std::string &origin() const override {
		return origin_;
	}

	const std::filesystem::path &path() const {
		return path_;
	}

	SourceRows read() const override;

private:
	std::filesystem::path path_;
	std::string origin_;
};

/**
 * @brief Splits one CSV line into fields, honouring double-quoted fields
 * with "" escapes.
 * @return false if a quoted field is not terminated.
 */
bool splitCsvLine(const std::string &line, std::vector<std::string> &fields);

/**
 * @brief Every regular `*.csv` file directly inside directory, ordered by
 * file name. A missing directory yields no sources.
 */
std::vector<std::shared_ptr<IRowSource>> discoverCsvSources(const std::filesystem::path &directory);

} // namespace campusenergy::ingest
