#include "infrastructure/CurrencyDataLoader.hpp"

#include "repositories/InMemoryCurrencyRepository.hpp"

#include <arrow/filesystem/api.h>
#include <arrow/filesystem/mockfs.h>
#include <arrow/io/api.h>
#include <gtest/gtest.h>

#include <string>

using namespace dme::infrastructure;
using dme::repositories::InMemoryCurrencyRepository;

namespace {

std::shared_ptr<arrow::fs::FileSystem> make_mock_fs() {
    auto mock = std::make_shared<arrow::fs::internal::MockFileSystem>(
        arrow::fs::TimePoint(std::chrono::seconds(0)));
    return std::make_shared<arrow::fs::SubTreeFileSystem>("/", mock);
}

void write_file(const std::shared_ptr<arrow::fs::FileSystem>& fs, const std::string& path,
                const std::string& content) {
    auto result = fs->OpenOutputStream(path);
    ASSERT_TRUE(result.ok());
    auto stream = *result;
    ASSERT_TRUE(stream->Write(content.data(), static_cast<int64_t>(content.size())).ok());
    ASSERT_TRUE(stream->Close().ok());
}

} // namespace

TEST(CurrencyDataFile, LoadsFromFilesystem) {
    auto fs = make_mock_fs();
    write_file(fs, "currencies.json",
               R"({"currencies": [{"code": "THB", "numeric_code": 764, "decimal_places": 2}]})");

    InMemoryCurrencyRepository repo;
    EXPECT_EQ(CurrencyDataLoader::load_from(repo, fs, "currencies.json"), 1u);
    EXPECT_EQ(repo.of("THB").numeric_code(), 764);
}

TEST(CurrencyDataFile, MissingFileThrows) {
    auto fs = make_mock_fs();
    InMemoryCurrencyRepository repo;
    EXPECT_THROW(CurrencyDataLoader::load_from(repo, fs, "missing.json"), std::runtime_error);
    EXPECT_EQ(repo.size(), 0u);
}

TEST(CurrencyDataFile, MalformedFileThrows) {
    auto fs = make_mock_fs();
    write_file(fs, "broken.json", "{\"currencies\": ");
    InMemoryCurrencyRepository repo;
    EXPECT_THROW(CurrencyDataLoader::load_from(repo, fs, "broken.json"), std::invalid_argument);
}

TEST(CurrencyDataFile, NullFilesystemThrows) {
    InMemoryCurrencyRepository repo;
    EXPECT_THROW(CurrencyDataLoader::load_from(repo, nullptr, "currencies.json"), std::invalid_argument);
}
