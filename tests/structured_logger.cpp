#include "shardrent/log/StructuredLogger.hpp"

#include <cassert>
#include <sstream>
#include <string>

namespace {

using shardrent::log::StructuredLogger;

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

}  // namespace

int main() {
    auto& logger = StructuredLogger::instance();
    std::ostringstream sink;
    logger.set_sink(&sink);
    logger.set_enabled(true);
    logger.set_min_level(StructuredLogger::Level::Info);

    logger.info("upload.committed", {{"file", "a \"quoted\" name"}, {"hosts", "3"}});
    const auto line = sink.str();
    assert(line.front() == '{');
    assert(line.back() == '\n');
    assert(contains(line, "\"ts\":\""));
    assert(contains(line, "\"level\":\"info\""));
    assert(contains(line, "\"event\":\"upload.committed\""));
    assert(contains(line, "\"fields\":{\"file\":\"a \\\"quoted\\\" name\",\"hosts\":\"3\"}"));

    sink.str({});
    logger.debug("upload.chunk.dispatched");
    assert(sink.str().empty());

    logger.set_min_level(StructuredLogger::Level::Debug);
    logger.debug("upload.chunk.dispatched");
    assert(contains(sink.str(), "\"level\":\"debug\""));
    assert(!contains(sink.str(), "fields"));

    sink.str({});
    logger.set_min_level(StructuredLogger::Level::Error);
    logger.warning("upload.worker.host_failed");
    assert(sink.str().empty());
    logger.error("renter.upload.rolled_back", {{"error", "line\nbreak"}});
    assert(contains(sink.str(), "line\\nbreak"));

    sink.str({});
    logger.set_enabled(false);
    logger.error("renter.upload.rolled_back");
    assert(sink.str().empty());

    StructuredLogger::Level level{};
    assert(StructuredLogger::parse_level("warning", level));
    assert(level == StructuredLogger::Level::Warning);
    assert(!StructuredLogger::parse_level("loud", level));

    logger.set_enabled(true);
    logger.set_min_level(StructuredLogger::Level::Info);
    logger.set_sink(nullptr);
    return 0;
}
