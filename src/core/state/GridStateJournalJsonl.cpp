#include "core/state/GridStateJournalJsonl.h"
#include "common/Logger.h"

#include <algorithm>
#include <fstream>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

namespace supergrid {
namespace core {

namespace {
std::uint64_t parseSeq(const nlohmann::json& line) {
    return line.value("seq", static_cast<std::uint64_t>(0));
}

nlohmann::json optionalPrice(const std::optional<double>& value) {
    if (value) {
        return *value;
    }
    return nullptr;
}

std::optional<double> readOptionalPrice(const nlohmann::json& line, const char* key) {
    if (!line.contains(key) || line[key].is_null()) {
        return std::nullopt;
    }
    return line[key].get<double>();
}
} // namespace

GridStateJournalJsonl::GridStateJournalJsonl(std::filesystem::path file_path)
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
        } catch (const nlohmann::json::exception&) {
            // Ignore malformed line and continue scanning.
        }
    }
}

void GridStateJournalJsonl::onGridState(const strategy::GridStateSnapshot& snapshot) {
    if (!append(snapshot)) {
        LOG_WARN("Grid state journal append failed: {}", file_path_.string());
    }
}

bool GridStateJournalJsonl::append(const strategy::GridStateSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path(), ec);
        if (ec) {
            return false;
        }
    }
    std::ofstream out(file_path_, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        return false;
    }

    strategy::GridStateSnapshot numbered = snapshot;
    numbered.seq = last_seq_ + 1;

    out << toJson(numbered).dump() << "\n";
    last_seq_ = numbered.seq;
    return true;
}

std::vector<strategy::GridStateSnapshot> GridStateJournalJsonl::readFrom(std::uint64_t seq_inclusive) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<strategy::GridStateSnapshot> out;
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
            if (parseSeq(line) < seq_inclusive) {
                continue;
            }
            out.push_back(fromJson(line));
        } catch (const nlohmann::json::exception&) {
            continue;
        }
    }

    return out;
}

std::uint64_t GridStateJournalJsonl::lastSeq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_seq_;
}

nlohmann::json GridStateJournalJsonl::toJson(const strategy::GridStateSnapshot& snapshot) {
    nlohmann::json line;
    line["seq"] = snapshot.seq;
    line["vt_symbol"] = snapshot.vt_symbol;
    line["pos"] = snapshot.position;
    line["vt_orderid"] = snapshot.pending_order_id;
    line["touch_up"] = snapshot.touch_up;
    line["touch_dn"] = snapshot.touch_dn;
    line["lowest_price"] = optionalPrice(snapshot.lowest_price);
    line["highest_price"] = optionalPrice(snapshot.highest_price);
    line["trigger_price"] = snapshot.trigger_price;
    line["grid_sleep"] = snapshot.grid_sleep;
    return line;
}

strategy::GridStateSnapshot GridStateJournalJsonl::fromJson(const nlohmann::json& line) {
    strategy::GridStateSnapshot snapshot;
    snapshot.seq = parseSeq(line);
    snapshot.vt_symbol = line.value("vt_symbol", std::string());
    snapshot.position = line.value("pos", 0.0);
    snapshot.pending_order_id = line.value("vt_orderid", std::string());
    snapshot.touch_up = line.value("touch_up", false);
    snapshot.touch_dn = line.value("touch_dn", false);
    snapshot.lowest_price = readOptionalPrice(line, "lowest_price");
    snapshot.highest_price = readOptionalPrice(line, "highest_price");
    snapshot.trigger_price = line.value("trigger_price", 0.0);
    snapshot.grid_sleep = line.value("grid_sleep", false);
    return snapshot;
}

} // namespace core
} // namespace supergrid
