#include "backtest/TradeJournalJsonl.h"
#include "common/Logger.h"

#include <algorithm>
#include <fstream>
#include <system_error>

namespace ladder {
namespace backtest {

namespace {
std::uint64_t parseSeq(const nlohmann::json& line) {
    return line.value("seq", static_cast<std::uint64_t>(0));
}

bool ensureParentDir(const std::filesystem::path& file_path) {
    if (!file_path.has_parent_path()) {
        return true;
    }
    std::error_code ec;
    std::filesystem::create_directories(file_path.parent_path(), ec);
    return !ec;
}

bool writeLine(std::ofstream& out, std::uint64_t seq, const engine::TradeRecord& trade) {
    nlohmann::json line = TradeJournalJsonl::toJson(trade);
    line["seq"] = seq;
    out << line.dump() << "\n";
    return static_cast<bool>(out);
}
}

TradeJournalJsonl::TradeJournalJsonl(std::filesystem::path file_path)
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
            const nlohmann::json line = nlohmann::json::parse(row);
            last_seq_ = std::max(last_seq_, parseSeq(line));
        } catch (const nlohmann::json::exception& e) {
            LOG_WARN("Skipping malformed journal line in {}: {}", file_path_.string(), e.what());
        }
    }
}

nlohmann::json TradeJournalJsonl::toJson(const engine::TradeRecord& trade) {
    nlohmann::json j;
    j["side"] = orderSideToString(trade.side);
    j["level"] = trade.level;
    j["position_id"] = trade.position_id;
    j["ts_ms"] = trade.timestamp;
    j["price"] = trade.price;
    j["size"] = trade.size;
    j["cash_delta"] = trade.cash_delta;
    if (trade.isSell()) {
        j["entry_price"] = trade.entry_price;
        j["realized_pnl"] = trade.realized_pnl;
    }
    return j;
}

engine::TradeRecord TradeJournalJsonl::fromJson(const nlohmann::json& line) {
    engine::TradeRecord trade;
    trade.side = (line.value("side", std::string("BUY")) == "SELL") ? OrderSide::SELL : OrderSide::BUY;
    trade.level = line.value("level", 0);
    trade.position_id = line.value("position_id", 0LL);
    trade.timestamp = line.value("ts_ms", 0LL);
    trade.price = line.value("price", 0.0);
    trade.size = line.value("size", 0.0);
    trade.cash_delta = line.value("cash_delta", 0.0);
    trade.entry_price = line.value("entry_price", 0.0);
    trade.realized_pnl = line.value("realized_pnl", 0.0);
    return trade;
}

bool TradeJournalJsonl::append(const engine::TradeRecord& trade) {
    if (!ensureParentDir(file_path_)) {
        return false;
    }
    std::ofstream out(file_path_, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        return false;
    }

    const std::uint64_t next_seq = last_seq_ + 1;
    if (!writeLine(out, next_seq, trade)) {
        return false;
    }
    last_seq_ = next_seq;
    return true;
}

bool TradeJournalJsonl::rewriteAll(const std::vector<engine::TradeRecord>& trades) {
    if (!ensureParentDir(file_path_)) {
        return false;
    }
    std::ofstream out(file_path_, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return false;
    }

    last_seq_ = 0;
    for (const auto& trade : trades) {
        if (!writeLine(out, last_seq_ + 1, trade)) {
            return false;
        }
        ++last_seq_;
    }
    return true;
}

std::vector<JournalEntry> TradeJournalJsonl::readFrom(std::uint64_t seq_inclusive) const {
    std::vector<JournalEntry> out;
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

        JournalEntry entry;
        entry.seq = seq;
        entry.trade = fromJson(line);
        out.push_back(std::move(entry));
    }

    return out;
}

} // namespace backtest
} // namespace ladder
