#include "core/state/GridStateJournalJsonl.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

using supergrid::core::GridStateJournalJsonl;
using supergrid::strategy::GridStateSnapshot;

int main() {
    const auto path = std::filesystem::temp_directory_path() / "supergrid_test" / "grid_state.jsonl";
    std::error_code ec;
    std::filesystem::remove(path, ec);

    GridStateSnapshot first;
    first.vt_symbol = "BTCUSDT.BINANCE";
    first.position = 0.0;
    first.trigger_price = 47000.0;

    GridStateSnapshot second;
    second.vt_symbol = "BTCUSDT.BINANCE";
    second.position = -0.1;
    second.pending_order_id = "BT-1";
    second.touch_up = true;
    second.highest_price = 48000.0;
    second.trigger_price = 47465.0;

    {
        GridStateJournalJsonl journal(path);
        if (journal.lastSeq() != 0) {
            std::cerr << "[TEST] fresh journal should start at seq 0, got " << journal.lastSeq() << "\n";
            return 1;
        }
        if (!journal.append(first) || !journal.append(second)) {
            std::cerr << "[TEST] append failed\n";
            return 1;
        }
        if (journal.lastSeq() != 2) {
            std::cerr << "[TEST] lastSeq should be 2, got " << journal.lastSeq() << "\n";
            return 1;
        }

        const auto rows = journal.readFrom(2);
        if (rows.size() != 1) {
            std::cerr << "[TEST] readFrom(2) should return 1 row, got " << rows.size() << "\n";
            return 1;
        }
        const auto& row = rows.front();
        if (row.seq != 2 || row.pending_order_id != "BT-1" || !row.touch_up || row.touch_dn) {
            std::cerr << "[TEST] unexpected row content\n";
            return 1;
        }
        if (!row.highest_price || *row.highest_price != 48000.0 || row.lowest_price) {
            std::cerr << "[TEST] optional prices not preserved\n";
            return 1;
        }
        if (row.position != -0.1 || row.trigger_price != 47465.0) {
            std::cerr << "[TEST] numeric fields not preserved\n";
            return 1;
        }
    }

    // unset optionals are written as null
    {
        const auto line = GridStateJournalJsonl::toJson(first);
        if (!line["highest_price"].is_null() || !line["lowest_price"].is_null()) {
            std::cerr << "[TEST] unset prices should serialize as null\n";
            return 1;
        }
        if (line["vt_orderid"].get<std::string>() != "") {
            std::cerr << "[TEST] empty order id expected\n";
            return 1;
        }
    }

    // garbage lines are skipped and seq resumes after reopen
    {
        std::ofstream out(path, std::ios::binary | std::ios::app);
        out << "not json\n";
    }
    {
        GridStateJournalJsonl reopened(path);
        if (reopened.lastSeq() != 2) {
            std::cerr << "[TEST] reopened journal should resume at seq 2, got " << reopened.lastSeq() << "\n";
            return 1;
        }
        reopened.onGridState(first);
        if (reopened.lastSeq() != 3) {
            std::cerr << "[TEST] observer append should advance seq to 3\n";
            return 1;
        }
        if (reopened.readFrom(1).size() != 3) {
            std::cerr << "[TEST] readFrom(1) should skip the malformed line\n";
            return 1;
        }
    }

    std::filesystem::remove(path, ec);
    std::cout << "[TEST] GridStateJournal PASSED\n";
    return 0;
}
