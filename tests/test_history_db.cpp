#include <catch2/catch_test_macros.hpp>

#include "storage/history_db.hpp"

#include <cstdlib>
#include <filesystem>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace {

struct TmpDb {
    std::string path;

    TmpDb() {
        path = std::filesystem::temp_directory_path() /
               ("wg_test_db_" + std::to_string(getpid()) + ".sqlite");
    }

    ~TmpDb() {
        std::filesystem::remove(path);
        std::filesystem::remove(path + "-wal");
        std::filesystem::remove(path + "-shm");
    }
};

TranscriptionResult result_with(const std::string& text) {
    return TranscriptionResult{.text = text, .language = "en", .segments = {}, .processing_time = 0.4};
}

} // namespace

TEST_CASE("HistoryDb", "[history]") {

    SECTION("OpenCreatesFile") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));
        REQUIRE(db.is_open());
        REQUIRE(std::filesystem::exists(tmp.path));
    }

    SECTION("InsertAndRetrieve") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        TranscribeParams params{.model = "small", .language = "en", .task = "translate"};
        REQUIRE(db.insert(result_with("hello world"), params, "upload.wav", 4096, 1.25));

        auto entries = db.recent(1);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].text == "hello world");
        REQUIRE(entries[0].language == "en");
        REQUIRE(entries[0].model == "small");
        REQUIRE(entries[0].task == "translate");
        REQUIRE(entries[0].source == "upload.wav");
        REQUIRE(entries[0].audio_bytes == 4096);
        REQUIRE(entries[0].processing_time == 1.25);
    }

    SECTION("LimitWorks") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        for (int i = 0; i < 5; ++i) {
            REQUIRE(db.insert(result_with("entry " + std::to_string(i)), {}, "", 10, 0.1));
        }

        auto entries = db.recent(2);
        REQUIRE(entries.size() == 2);
    }

    SECTION("ReverseChronological") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        REQUIRE(db.insert(result_with("first"), {}, "", 1, 0.1));
        REQUIRE(db.insert(result_with("second"), {}, "", 1, 0.1));
        REQUIRE(db.insert(result_with("third"), {}, "", 1, 0.1));

        auto entries = db.recent(3);
        REQUIRE(entries.size() == 3);
        REQUIRE(entries[0].text == "third");
        REQUIRE(entries[1].text == "second");
        REQUIRE(entries[2].text == "first");
    }

    SECTION("NullableFields") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        // Empty strings are stored as NULL and read back empty
        TranscriptionResult r;
        r.text = "test";
        TranscribeParams params{.model = "", .language = {}, .task = ""};
        REQUIRE(db.insert(r, params, "", 0, 0.0));

        auto entries = db.recent(1);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].language.empty());
        REQUIRE(entries[0].model.empty());
        REQUIRE(entries[0].source.empty());
    }

    SECTION("TimestampAutoPopulated") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        REQUIRE(db.insert(result_with("test"), {}, "", 1, 0.1));

        auto entries = db.recent(1);
        REQUIRE(entries.size() == 1);
        REQUIRE_FALSE(entries[0].timestamp.empty());
    }

    SECTION("ClosedDbRejectsWrites") {
        HistoryDb db;
        REQUIRE_FALSE(db.is_open());
        REQUIRE_FALSE(db.insert(result_with("x"), {}, "", 1, 0.1));
        REQUIRE(db.recent(5).empty());
    }

    SECTION("ConcurrentInserts") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        std::vector<std::thread> threads;
        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([&db, t] {
                for (int i = 0; i < 10; ++i) {
                    db.insert(result_with(std::to_string(t) + ":" + std::to_string(i)), {}, "", 1, 0.1);
                }
            });
        }
        for (auto& t : threads) t.join();

        REQUIRE(db.recent(100).size() == 40);
    }
}
