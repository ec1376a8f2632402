#include "campus-energy/ingest/raw_record.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace campusenergy::ingest {

std::string diagnosticKindName(DiagnosticKind kind) {
	switch (kind) {
	case DiagnosticKind::SourceUnavailable:
		return "SourceUnavailable";
	case DiagnosticKind::RecordMalformed:
		return "RecordMalformed";
	case DiagnosticKind::ValidationFailure:
		return "ValidationFailure";
	default:
		throw std::logic_error("Unsupported diagnostic kind.");
	}
}

std::string Diagnostic::toString() const {
	std::ostringstream out;
	out << diagnosticKindName(kind) << " [" << origin;
	if (row) {
		out << ":" << *row;
	}
	out << "] " << message;
	return out.str();
}

std::size_t IngestionReport::count(DiagnosticKind kind) const {
	return static_cast<std::size_t>(std::count_if(diagnostics.begin(), diagnostics.end(),
	                                              [kind](const Diagnostic &d) { return d.kind == kind; }));
}

} // namespace campusenergy::ingest
