#include <gtest/gtest.h>

#include "test_support.hpp"
#include "transfer/failure_ledger.hpp"
#include "transfer/transfer_error.hpp"

using test_support::temp_dir;

TEST(FailureLedgerTest, SaveThenLoadPreservesChunks) {
    temp_dir dir;
    failure_ledger ledger(dir.file("out.bin.failed_chunks.json"));
    std::vector<chunk> chunks{{1, 10, 19}, {4, 40, 44}};

    ledger.save(chunks);
    EXPECT_TRUE(ledger.exists());
    EXPECT_EQ(ledger.load(), chunks);
}

TEST(FailureLedgerTest, WritesJsonArrayOfObjects) {
    temp_dir dir;
    failure_ledger ledger(dir.file("ledger.json"));
    ledger.save({{1, 10, 19}});

    std::string text = test_support::read_file(ledger.path());
    EXPECT_NE(text.find("\"index\":1"), std::string::npos);
    EXPECT_NE(text.find("\"start\":10"), std::string::npos);
    EXPECT_NE(text.find("\"end\":19"), std::string::npos);
    EXPECT_EQ(text.front(), '[');
}

TEST(FailureLedgerTest, MissingFileLoadsEmpty) {
    temp_dir dir;
    failure_ledger ledger(dir.file("none.json"));
    EXPECT_FALSE(ledger.exists());
    EXPECT_TRUE(ledger.load().empty());
}

TEST(FailureLedgerTest, SaveReplacesPreviousContents) {
    temp_dir dir;
    failure_ledger ledger(dir.file("ledger.json"));
    ledger.save({{0, 0, 9}, {1, 10, 19}});
    ledger.save({{2, 20, 24}});
    EXPECT_EQ(ledger.load(), (std::vector<chunk>{{2, 20, 24}}));
}

TEST(FailureLedgerTest, ClearIsIdempotent) {
    temp_dir dir;
    failure_ledger ledger(dir.file("ledger.json"));
    ledger.save({{0, 0, 9}});
    ledger.clear();
    EXPECT_FALSE(ledger.exists());
    EXPECT_NO_THROW(ledger.clear());
}

TEST(FailureLedgerTest, CorruptFileIsReported) {
    temp_dir dir;
    failure_ledger ledger(dir.file("ledger.json"));
    for (const char* body : {"not json", "{\"index\":1}", "[{\"index\":1,\"start\":5}]",
                             "[{\"index\":1,\"start\":9,\"end\":2}]",
                             "[{\"index\":-1,\"start\":0,\"end\":2}]"}) {
        test_support::write_file(ledger.path(), body);
        try {
            ledger.load();
            FAIL() << "accepted: " << body;
        } catch (const transfer_error& e) {
            EXPECT_EQ(e.kind(), error_kind::ledger_corrupt) << body;
        }
    }
}

TEST(FailureLedgerTest, UnwritableLocationIsFilesystemError) {
    temp_dir dir;
    failure_ledger ledger(dir.file("missing/dir/ledger.json"));
    try {
        ledger.save({{0, 0, 9}});
        FAIL() << "expected transfer_error";
    } catch (const transfer_error& e) {
        EXPECT_EQ(e.kind(), error_kind::filesystem);
    }
}
