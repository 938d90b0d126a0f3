#include "core/state/EventJournalJsonl.h"

#include <algorithm>
#include <fstream>

#include "common/Logger.h"

namespace rebalex {
namespace core {

namespace {
std::uint64_t parseSeq(const nlohmann::json& line) {
    return line.value("seq", static_cast<std::uint64_t>(0));
}
}

EventJournalJsonl::EventJournalJsonl(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }
        try {
            nlohmann::json line = nlohmann::json::parse(row);
            last_seq_ = (std::max)(last_seq_, parseSeq(line));
        } catch (const nlohmann::json::exception& e) {
            LOG_WARN("journal: skipping malformed line in {}: {}", file_path_.string(), e.what());
        }
    }
}

bool EventJournalJsonl::append(const JournalEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    std::filesystem::create_directories(file_path_.parent_path(), ec);
    std::ofstream out(file_path_, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        LOG_ERROR("journal: cannot open {}", file_path_.string());
        return false;
    }

    const std::uint64_t next_seq = last_seq_ + 1;
    nlohmann::json line;
    line["seq"] = next_seq;
    line["ts_ms"] = event.ts_ms;
    line["type"] = toString(event.type);
    line["symbol"] = event.symbol;
    line["entity_id"] = event.entity_id;
    line["payload"] = event.payload.is_null() ? nlohmann::json::object() : event.payload;

    out << line.dump() << "\n";
    last_seq_ = next_seq;
    return true;
}

std::vector<JournalEvent> EventJournalJsonl::readFrom(std::uint64_t seq_inclusive) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<JournalEvent> out;
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return out;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }

        nlohmann::json line;
        try {
            line = nlohmann::json::parse(row);
        } catch (const nlohmann::json::exception&) {
            continue;
        }

        const auto seq = parseSeq(line);
        if (seq < seq_inclusive) {
            continue;
        }

        JournalEvent event;
        event.seq = seq;
        event.ts_ms = line.value("ts_ms", 0LL);
        event.type = fromString(line.value("type", std::string("ORDER_STATUS_CHANGED")));
        event.symbol = line.value("symbol", std::string());
        event.entity_id = line.value("entity_id", std::string());
        event.payload = line.value("payload", nlohmann::json::object());
        out.push_back(std::move(event));
    }

    return out;
}

std::uint64_t EventJournalJsonl::lastSeq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_seq_;
}

std::string EventJournalJsonl::toString(JournalEventType type) {
    switch (type) {
        case JournalEventType::RUN_CREATED: return "RUN_CREATED";
        case JournalEventType::RUN_STATUS_CHANGED: return "RUN_STATUS_CHANGED";
        case JournalEventType::ORDER_CREATED: return "ORDER_CREATED";
        case JournalEventType::ORDER_STATUS_CHANGED: return "ORDER_STATUS_CHANGED";
        case JournalEventType::FILL_APPLIED: return "FILL_APPLIED";
        case JournalEventType::COMMAND_WRITTEN: return "COMMAND_WRITTEN";
        case JournalEventType::COMMAND_SUPERSEDED: return "COMMAND_SUPERSEDED";
        case JournalEventType::PROCESS_LAUNCHED: return "PROCESS_LAUNCHED";
        case JournalEventType::PROCESS_TERMINATED: return "PROCESS_TERMINATED";
    }
    return "ORDER_STATUS_CHANGED";
}

JournalEventType EventJournalJsonl::fromString(const std::string& value) {
    if (value == "RUN_CREATED") return JournalEventType::RUN_CREATED;
    if (value == "RUN_STATUS_CHANGED") return JournalEventType::RUN_STATUS_CHANGED;
    if (value == "ORDER_CREATED") return JournalEventType::ORDER_CREATED;
    if (value == "ORDER_STATUS_CHANGED") return JournalEventType::ORDER_STATUS_CHANGED;
    if (value == "FILL_APPLIED") return JournalEventType::FILL_APPLIED;
    if (value == "COMMAND_WRITTEN") return JournalEventType::COMMAND_WRITTEN;
    if (value == "COMMAND_SUPERSEDED") return JournalEventType::COMMAND_SUPERSEDED;
    if (value == "PROCESS_LAUNCHED") return JournalEventType::PROCESS_LAUNCHED;
    if (value == "PROCESS_TERMINATED") return JournalEventType::PROCESS_TERMINATED;
    return JournalEventType::ORDER_STATUS_CHANGED;
}

} // namespace core
} // namespace rebalex
