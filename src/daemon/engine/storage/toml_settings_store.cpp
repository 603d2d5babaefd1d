//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "toml_settings_store.hpp"

#include "io/io.hpp"
#include "logging.hpp"
#include "mqdevd/platform/posix_utils.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <toml.hpp>

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <exception>
#include <fcntl.h>
#include <memory>
#include <string>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <utility>

namespace mqdevd
{
namespace daemon
{
namespace engine
{
namespace storage
{
namespace
{

constexpr const char* SettingsTable = "settings";

/// Creates the (last level of) parent directory of the file, if missing.
///
int ensureParentDirectory(const std::string& file_path)
{
    const auto slash_pos = file_path.find_last_of('/');
    if ((slash_pos == std::string::npos) || (slash_pos == 0))
    {
        return 0;
    }

    const auto dir_path = file_path.substr(0, slash_pos);
    const auto err      = platform::posixSyscallError([&dir_path] {
        //
        return ::mkdir(dir_path.c_str(), 0755);  // NOLINT(*-magic-numbers)
    });
    return (err == EEXIST) ? 0 : err;
}

}  // namespace

TomlSettingsStore::Ptr TomlSettingsStore::make(std::string file_path)
{
    auto logger = common::getLogger("storage");

    if (const auto err = ensureParentDirectory(file_path))
    {
        logger->error("Failed to create directory of settings file '{}': {}.", file_path, std::strerror(err));
        return nullptr;
    }

    TomlValue root{TomlValue::table_type{}};
    if (::access(file_path.c_str(), F_OK) == 0)
    {
        try
        {
            root = toml::parse<TomlConf>(file_path);

        } catch (const std::exception& ex)
        {
            logger->error("Failed to load settings file '{}'.\n{}", file_path, ex.what());
            return nullptr;
        }
        if (!root.is_table())
        {
            logger->error("Settings file '{}' has no root table.", file_path);
            return nullptr;
        }
        logger->debug("Loaded settings file '{}'.", file_path);
    }
    else
    {
        logger->info("Settings file '{}' doesn't exist yet, starting empty.", file_path);
    }

    return std::make_unique<TomlSettingsStore>(std::move(file_path), std::move(root));
}

TomlSettingsStore::TomlSettingsStore(std::string file_path, TomlValue&& root)
    : file_path_{std::move(file_path)}
    , root_{std::move(root)}
{
}

cetl::optional<std::string> TomlSettingsStore::get(const std::string& key) const
{
    if (!root_.contains(SettingsTable))
    {
        return cetl::nullopt;
    }
    const auto& settings = root_.at(SettingsTable);
    if (!settings.is_table() || !settings.contains(key))
    {
        return cetl::nullopt;
    }
    const auto& value = settings.at(key);
    if (!value.is_string())
    {
        logger_->warn("Ignoring non-string setting '{}'.", key);
        return cetl::nullopt;
    }
    return value.as_string();
}

int TomlSettingsStore::set(const std::string& key, const std::string& value)
{
    // Modify a copy, and commit it to memory only once it has been committed to the file.
    auto updated = root_;
    try
    {
        updated[SettingsTable][key] = value;
        if (const auto err = writeAtomically(toml::format(updated)))
        {
            logger_->error("Failed to save setting '{}' to '{}': {}.", key, file_path_, std::strerror(err));
            return err;
        }

    } catch (const std::exception& ex)
    {
        logger_->error("Failed to format setting '{}': {}", key, ex.what());
        return EINVAL;
    }

    root_ = std::move(updated);
    logger_->trace("Saved setting '{}'='{}'.", key, value);
    return 0;
}

int TomlSettingsStore::writeAtomically(const std::string& content) const
{
    using platform::posixSyscallError;

    const auto tmp_path = file_path_ + ".tmp";

    common::io::OwnFd tmp_fd;
    if (const auto err = posixSyscallError([&tmp_path, &tmp_fd] {
            //
            // NOLINTNEXTLINE(*-vararg, *-magic-numbers)
            tmp_fd = common::io::OwnFd{::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644)};
            return tmp_fd.get();
        }))
    {
        return err;
    }

    std::size_t offset = 0;
    while (offset < content.size())
    {
        ssize_t written = 0;
        if (const auto err = posixSyscallError([&] {
                //
                written = ::write(tmp_fd.get(), content.data() + offset, content.size() - offset);
                return written;
            }))
        {
            return err;
        }
        offset += static_cast<std::size_t>(written);
    }

    if (const auto err = posixSyscallError([&tmp_fd] {
            //
            return ::fsync(tmp_fd.get());
        }))
    {
        return err;
    }
    if (const auto err = tmp_fd.close())
    {
        return err;
    }

    return posixSyscallError([this, &tmp_path] {
        //
        return ::rename(tmp_path.c_str(), file_path_.c_str());
    });
}

}  // namespace storage
}  // namespace engine
}  // namespace daemon
}  // namespace mqdevd
