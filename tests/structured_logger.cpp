#include "sharemesh/daemon/StructuredLogger.hpp"

#include <cassert>
#include <sstream>
#include <string>

using sharemesh::daemon::StructuredLogger;

int main() {
    auto& logger = StructuredLogger::instance();
    std::ostringstream out;
    logger.set_stream(&out);
    logger.set_enabled(true);
    logger.set_threshold(StructuredLogger::Level::Info);

    logger.info("transfer.chunk.retry", {{"job", "7"}, {"reason", "hash \"mismatch\"\n"}, {"event", "x"}});
    const auto line = out.str();
    assert(line.rfind("{\"ts\":\"", 0) == 0);
    assert(line.back() == '\n');
    assert(line.find("\"level\":\"info\"") != std::string::npos);
    assert(line.find("\"event\":\"transfer.chunk.retry\"") != std::string::npos);
    assert(line.find("\"job\":\"7\"") != std::string::npos);
    assert(line.find("\"reason\":\"hash \\\"mismatch\\\"\\n\"") != std::string::npos);
    // A field may not shadow the record's own keys.
    assert(line.find("\"field_event\":\"x\"") != std::string::npos);
    assert(line.find('Z') != std::string::npos);

    out.str({});
    logger.set_threshold(StructuredLogger::Level::Warning);
    logger.info("session.opened");
    assert(out.str().empty());
    logger.warning("session.failed", {{"kind", "AuthError"}});
    assert(out.str().find("\"level\":\"warning\"") != std::string::npos);

    out.str({});
    logger.set_enabled(false);
    logger.error("transfer.job.failed");
    assert(out.str().empty());

    assert(StructuredLogger::parse_level("error") == StructuredLogger::Level::Error);
    assert(!StructuredLogger::parse_level("debug").has_value());
    assert(StructuredLogger::to_string(StructuredLogger::Level::Warning) == "warning");

    logger.set_stream(nullptr);
    return 0;
}
