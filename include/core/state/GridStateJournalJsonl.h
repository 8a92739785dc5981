#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/contracts/IGridObserver.h"

namespace supergrid {
namespace core {

// Appends every grid state snapshot as one JSON line.
class GridStateJournalJsonl : public IGridObserver {
public:
    explicit GridStateJournalJsonl(std::filesystem::path file_path);

    void onGridState(const strategy::GridStateSnapshot& snapshot) override;

    bool append(const strategy::GridStateSnapshot& snapshot);
    std::vector<strategy::GridStateSnapshot> readFrom(std::uint64_t seq_inclusive);
    std::uint64_t lastSeq() const;

    static nlohmann::json toJson(const strategy::GridStateSnapshot& snapshot);
    static strategy::GridStateSnapshot fromJson(const nlohmann::json& line);

private:
    std::filesystem::path file_path_;
    mutable std::mutex mutex_;
    std::uint64_t last_seq_ = 0;
};

} // namespace core
} // namespace supergrid
