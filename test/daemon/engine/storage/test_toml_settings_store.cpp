//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "storage/toml_settings_store.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

namespace
{

using namespace mqdevd::daemon::engine::storage;  // NOLINT This our main concern here in the unit tests.

using testing::Eq;
using testing::IsNull;
using testing::NotNull;
using testing::HasSubstr;

class TestTomlSettingsStore : public testing::Test
{
protected:
    void SetUp() override
    {
        std::string dir_template{"/tmp/mqdevd_test_XXXXXX"};
        ASSERT_THAT(::mkdtemp(&dir_template[0]), NotNull());
        dir_path_  = dir_template;
        file_path_ = dir_path_ + "/state/settings.toml";
    }

    void TearDown() override
    {
        (void) std::remove(file_path_.c_str());
        (void) std::remove((file_path_ + ".tmp").c_str());
        (void) ::rmdir((dir_path_ + "/state").c_str());
        (void) ::rmdir(dir_path_.c_str());
    }

    void writeFile(const std::string& content) const
    {
        ASSERT_THAT(::mkdir((dir_path_ + "/state").c_str(), 0755), 0);  // NOLINT(*-magic-numbers)
        std::ofstream file{file_path_};
        file << content;
    }

    std::string readFile() const
    {
        std::ifstream file{file_path_};
        return {std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
    }

    // NOLINTBEGIN
    std::string dir_path_;
    std::string file_path_;
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestTomlSettingsStore, starts_empty_without_file)
{
    const auto store = TomlSettingsStore::make(file_path_);
    ASSERT_THAT(store, NotNull());

    EXPECT_FALSE(store->get("reserved/temperature"));
    EXPECT_THAT(::access(file_path_.c_str(), F_OK), -1);
}

TEST_F(TestTomlSettingsStore, set_persists_across_instances)
{
    {
        const auto store = TomlSettingsStore::make(file_path_);
        ASSERT_THAT(store, NotNull());

        EXPECT_THAT(store->set("instance/temperature/fe001/t1", "0"), 0);
        EXPECT_THAT(store->set("reserved/temperature", "0,1"), 0);
        EXPECT_THAT(store->set("reserved/temperature", "0,1,2"), 0);
        EXPECT_THAT(store->get("reserved/temperature"), Eq(cetl::optional<std::string>{"0,1,2"}));
    }
    EXPECT_THAT(::access((file_path_ + ".tmp").c_str(), F_OK), -1);
    EXPECT_THAT(readFile(), HasSubstr("[settings]"));

    const auto store = TomlSettingsStore::make(file_path_);
    ASSERT_THAT(store, NotNull());
    EXPECT_THAT(store->get("instance/temperature/fe001/t1"), Eq(cetl::optional<std::string>{"0"}));
    EXPECT_THAT(store->get("reserved/temperature"), Eq(cetl::optional<std::string>{"0,1,2"}));
    EXPECT_FALSE(store->get("instance/temperature/fe001/t2"));
}

TEST_F(TestTomlSettingsStore, keeps_unrelated_content)
{
    writeFile("[other]\nanswer = 42\n\n[settings]\n\"instance/tank/fe001/k1\" = \"3\"\ncount = 5\n");

    const auto store = TomlSettingsStore::make(file_path_);
    ASSERT_THAT(store, NotNull());
    EXPECT_THAT(store->get("instance/tank/fe001/k1"), Eq(cetl::optional<std::string>{"3"}));

    // Non-string values are not settings.
    EXPECT_FALSE(store->get("count"));

    EXPECT_THAT(store->set("reserved/tank", "3"), 0);
    const auto content = readFile();
    EXPECT_THAT(content, HasSubstr("answer = 42"));
    EXPECT_THAT(content, HasSubstr("instance/tank/fe001/k1"));
    EXPECT_THAT(content, HasSubstr("reserved/tank"));
}

TEST_F(TestTomlSettingsStore, corrupted_file)
{
    writeFile("[settings\n\"key\" = ");

    EXPECT_THAT(TomlSettingsStore::make(file_path_), IsNull());
}

TEST_F(TestTomlSettingsStore, set_failure_keeps_previous_value)
{
    const auto store = TomlSettingsStore::make(file_path_);
    ASSERT_THAT(store, NotNull());
    EXPECT_THAT(store->set("key", "old"), 0);

    // Pull the directory away from under the store.
    ASSERT_THAT(std::remove(file_path_.c_str()), 0);
    ASSERT_THAT(::rmdir((dir_path_ + "/state").c_str()), 0);

    EXPECT_THAT(store->set("key", "new"), ENOENT);
    EXPECT_THAT(store->get("key"), Eq(cetl::optional<std::string>{"old"}));
}

}  // namespace
