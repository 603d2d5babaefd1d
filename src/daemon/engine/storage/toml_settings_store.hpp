//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MQDEVD_DAEMON_ENGINE_STORAGE_TOML_SETTINGS_STORE_HPP_INCLUDED
#define MQDEVD_DAEMON_ENGINE_STORAGE_TOML_SETTINGS_STORE_HPP_INCLUDED

#include "logging.hpp"
#include "settings_store.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <toml.hpp>

#include <memory>
#include <string>

namespace mqdevd
{
namespace daemon
{
namespace engine
{
namespace storage
{

/// Settings store kept in a TOML file (all settings are string values of its `[settings]` table).
///
/// Each `set` rewrites the whole file into a temporary sibling file, syncs it, and renames it over the original,
/// so the file always holds either the previous or the new content.
///
class TomlSettingsStore final : public SettingsStore
{
public:
    using Ptr       = std::unique_ptr<TomlSettingsStore>;
    using TomlConf  = toml::ordered_type_config;
    using TomlValue = toml::basic_value<TomlConf>;

    /// Opens the store, or starts an empty one if the file doesn't exist yet.
    ///
    /// @return `nullptr` if the existing file can't be read or parsed.
    ///
    CETL_NODISCARD static Ptr make(std::string file_path);

    TomlSettingsStore(std::string file_path, TomlValue&& root);

    // SettingsStore

    CETL_NODISCARD cetl::optional<std::string> get(const std::string& key) const override;
    CETL_NODISCARD int                         set(const std::string& key, const std::string& value) override;

private:
    int writeAtomically(const std::string& content) const;

    std::string       file_path_;
    TomlValue         root_;
    common::LoggerPtr logger_{common::getLogger("storage")};

};  // TomlSettingsStore

}  // namespace storage
}  // namespace engine
}  // namespace daemon
}  // namespace mqdevd

#endif  // MQDEVD_DAEMON_ENGINE_STORAGE_TOML_SETTINGS_STORE_HPP_INCLUDED
