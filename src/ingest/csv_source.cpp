#include "campus-energy/ingest/csv_source.hpp"

#include "campus-energy/utils/logging.hpp"

#include <algorithm>
#include <fstream>
#include <optional>
#include <system_error>
#include <utility>

namespace campusenergy::ingest {

namespace {

std::string trimField(const std::string &text) {
	const auto first = text.find_first_not_of(" \t\r\n");
	if (first == std::string::npos) {
		return {};
	}
	const auto last = text.find_last_not_of(" \t\r\n");
	return text.substr(first, last - first + 1);
}

bool isBlank(const std::string &line) {
	return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

std::optional<std::size_t> columnIndex(const std::vector<std::string> &header, const std::string &name) {
	const auto it = std::find(header.begin(), header.end(), name);
	if (it == header.end()) {
		return std::nullopt;
	}
	return static_cast<std::size_t>(it - header.begin());
}

std::optional<std::string> fieldAt(const std::vector<std::string> &fields, const std::optional<std::size_t> &index) {
	if (!index || *index >= fields.size()) {
		return std::nullopt;
	}
	return fields[*index];
}

// Stands in for a data directory that exists but cannot be listed, so the
// failure reaches the ingestion report.
class UnlistableDirectory final : public IRowSource {
public:
	UnlistableDirectory(const std::filesystem::path &directory, std::string reason)
	    : origin_(directory.filename().string()), reason_(std::move(reason)) {
		if (origin_.empty()) {
			origin_ = directory.string();
		}
	}

	const std::string &origin() const override {
		return origin_;
	}

	SourceRows read() const override {
		throw SourceUnavailable(origin_, reason_);
	}

private:
	std::string origin_;
	std::string reason_;
};

} // namespace

bool splitCsvLine(const std::string &line, std::vector<std::string> &fields) {
	fields.clear();
	std::string current;
	bool in_quotes = false;
	for (std::size_t i = 0; i < line.size(); ++i) {
		const char c = line[i];
		if (in_quotes) {
			if (c == '"') {
				if (i + 1 < line.size() && line[i + 1] == '"') {
					current.push_back('"');
					++i;
				} else {
					in_quotes = false;
				}
			} else {
				current.push_back(c);
			}
		} else if (c == '"') {
			in_quotes = true;
		} else if (c == ',') {
			fields.push_back(trimField(current));
			current.clear();
		} else {
			current.push_back(c);
		}
	}
	if (in_quotes) {
		return false;
	}
	fields.push_back(trimField(current));
	return true;
}

CsvRowSource::CsvRowSource(std::filesystem::path path) : path_(std::move(path)), origin_(path_.stem().string()) {
}

SourceRows CsvRowSource::read() const {
	std::ifstream input(path_);
	if (!input) {
		throw SourceUnavailable(origin_, "cannot open " + path_.string());
	}

	std::string line;
	std::vector<std::string> header;
	while (std::getline(input, line)) {
		if (!isBlank(line)) {
			break;
		}
	}
	if (isBlank(line)) {
		throw SourceUnavailable(origin_, "file has no header line");
	}
	if (line.size() >= 3 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) {
		line.erase(0, 3);
	}
	if (!splitCsvLine(line, header)) {
		throw SourceUnavailable(origin_, "header line has an unterminated quote");
	}

	const auto date_column = columnIndex(header, "Date");
	const auto kwh_column = columnIndex(header, "KWH");
	const auto building_column = columnIndex(header, "Building");
	if (!date_column) {
		throw SourceUnavailable(origin_, "missing required column 'Date'");
	}
	if (!kwh_column) {
		throw SourceUnavailable(origin_, "missing required column 'KWH'");
	}

	SourceRows rows;
	std::vector<std::string> fields;
	std::size_t row_number = 0;
	while (std::getline(input, line)) {
		++row_number;
		if (isBlank(line)) {
			continue;
		}
		if (!splitCsvLine(line, fields)) {
			rows.malformed.push_back(
			    Diagnostic{DiagnosticKind::RecordMalformed, origin_, row_number, "unterminated quoted field"});
			continue;
		}
		if (fields.size() > header.size()) {
			rows.malformed.push_back(Diagnostic{DiagnosticKind::RecordMalformed, origin_, row_number,
			                                    "expected " + std::to_string(header.size()) + " fields, saw " +
			                                        std::to_string(fields.size())});
			continue;
		}

		RawRecord record;
		record.date = fieldAt(fields, date_column);
		record.kwh = fieldAt(fields, kwh_column);
		record.building = fieldAt(fields, building_column);
		record.row = row_number;
		rows.records.push_back(std::move(record));
	}
	if (input.bad()) {
		throw SourceUnavailable(origin_, "read error on " + path_.string());
	}
	return rows;
}

std::vector<std::shared_ptr<IRowSource>> discoverCsvSources(const std::filesystem::path &directory) {
	std::vector<std::shared_ptr<IRowSource>> sources;
	std::error_code ec;
	if (!std::filesystem::is_directory(directory, ec)) {
		CAMPUS_WARN("Data directory {} not found; no sources discovered.", directory.string());
		return sources;
	}

	std::vector<std::filesystem::path> files;
	std::filesystem::directory_iterator it(directory, ec);
	for (const std::filesystem::directory_iterator end{}; !ec && it != end; it.increment(ec)) {
		std::error_code entry_ec;
		if (it->is_regular_file(entry_ec) && it->path().extension() == ".csv") {
			files.push_back(it->path());
		}
	}
	if (ec) {
		CAMPUS_WARN("Cannot list data directory {}: {}", directory.string(), ec.message());
		sources.push_back(std::make_shared<UnlistableDirectory>(directory, "cannot list directory " +
		                                                                       directory.string() + ": " +
		                                                                       ec.message()));
		return sources;
	}
	std::sort(files.begin(), files.end(),
	          [](const auto &lhs, const auto &rhs) { return lhs.filename().string() < rhs.filename().string(); });

	sources.reserve(files.size());
	for (auto &file : files) {
		sources.push_back(std::make_shared<CsvRowSource>(std::move(file)));
	}
	CAMPUS_DEBUG("Discovered {} CSV sources in {}.", sources.size(), directory.string());
	return sources;
}

} // namespace campusenergy::ingest
