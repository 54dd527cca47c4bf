#include "io/log_sink/file_log_sink.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>

class FileLogSinkTest : public ::testing::Test {
protected:
  void SetUp() override {
    test_dir = std::filesystem::temp_directory_path() / "threat_guard_sink_test";
    std::filesystem::remove_all(test_dir);
    cfg.file_path = (test_dir / "logs" / "attack_log.json").string();
  }

  void TearDown() override { std::filesystem::remove_all(test_dir); }

  void write_raw(const std::string &content) {
    std::ofstream out(cfg.file_path, std::ios::trunc);
    out << content;
  }

  static nlohmann::json incident() {
    return {{"incident_id", "inc-1-1"},
            {"attack_type", "CARD_TESTING"},
            {"ip", "10.0.0.6"},
            {"email", "victim@example.com"},
            {"data",
             {{"password", "hunter2"},
              {"card_number", "4111111111111111"},
              {"payment_token", "tok_1234567890"},
              {"card_bin", "411111"},
              {"amount", 12.5}}}};
  }

  std::filesystem::path test_dir;
  Config::LogSinkConfig cfg;
};

TEST_F(FileLogSinkTest, MissingFileReadsAsEmpty) {
  FileLogSink sink(cfg);
  auto entries = sink.read_all();
  EXPECT_TRUE(entries.is_array());
  EXPECT_TRUE(entries.empty());
}

TEST_F(FileLogSinkTest, PersistAppendsMaskedEntries) {
  FileLogSink sink(cfg);
  ASSERT_TRUE(sink.persist(incident()));
  ASSERT_TRUE(sink.persist(incident()));

  auto entries = sink.read_all();
  ASSERT_EQ(entries.size(), 2u);

  const auto &entry = entries[0];
  EXPECT_EQ(entry["email"], "[MASKED]");
  EXPECT_EQ(entry["data"]["password"], "[MASKED]");
  EXPECT_EQ(entry["data"]["card_number"], "XXXX-XXXX-XXXX-1111");
  EXPECT_EQ(entry["data"]["payment_token"], "tok_...[MASKED]");
  // Short payment values are kept
  EXPECT_EQ(entry["data"]["card_bin"], "411111");
  EXPECT_DOUBLE_EQ(entry["data"]["amount"].get<double>(), 12.5);
  EXPECT_EQ(entry["attack_type"], "CARD_TESTING");
}

TEST_F(FileLogSinkTest, IntegrityHashCoversMaskedEntry) {
  FileLogSink sink(cfg);
  auto entry = sink.prepare_entry(incident());

  ASSERT_TRUE(entry.contains("integrity_hash"));
  std::string hash = entry["integrity_hash"];
  EXPECT_EQ(hash.size(), 64u);
  EXPECT_EQ(hash.find_first_not_of("0123456789abcdef"), std::string::npos);

  entry.erase("integrity_hash");
  EXPECT_EQ(FileLogSink::sha256_hex(entry.dump()), hash);
}

TEST_F(FileLogSinkTest, Sha256KnownVector) {
  EXPECT_EQ(FileLogSink::sha256_hex("abc"),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(FileLogSinkTest, CorruptFileIsResetOnWrite) {
  FileLogSink sink(cfg);
  write_raw("{ this is not json");
  EXPECT_THROW(sink.read_all(), std::runtime_error);

  ASSERT_TRUE(sink.persist(incident()));
  auto entries = sink.read_all();
  ASSERT_EQ(entries.size(), 1u);
  EXPECT_EQ(entries[0]["incident_id"], "inc-1-1");
}

TEST_F(FileLogSinkTest, NonArrayFileIsRejectedOnRead) {
  FileLogSink sink(cfg);
  write_raw(R"({"incident_id": "x"})");
  EXPECT_THROW(sink.read_all(), std::runtime_error);

  write_raw("");
  EXPECT_TRUE(sink.read_all().empty());
}
