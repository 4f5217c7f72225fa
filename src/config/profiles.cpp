#include "archon/config/profiles.hpp"

#include "archon/config/config.hpp"

namespace archon::config {

namespace {

std::string not_found(const std::string &key) { return "Profile '" + key + "' not found"; }

} // namespace

ProfileStore::ProfileStore(std::filesystem::path config_file, Environment env)
    : config_file_(std::move(config_file)), env_(std::move(env)) {}

common::Result<Config> ProfileStore::load_config() const {
  return config::load_config(config_file_);
}

common::Status ProfileStore::save_config(const Config &config) const {
  return config::save_config(config, config_file_);
}

common::Result<std::map<std::string, Profile>> ProfileStore::profiles() const {
  auto loaded = load_config();
  if (!loaded.ok()) {
    return common::Result<std::map<std::string, Profile>>::failure(loaded.error());
  }
  return common::Result<std::map<std::string, Profile>>::success(
      std::move(loaded.value().profiles));
}

common::Result<Profile> ProfileStore::find(const std::string &key) const {
  auto loaded = load_config();
  if (!loaded.ok()) {
    return common::Result<Profile>::failure(loaded.error());
  }
  const auto it = loaded.value().profiles.find(key);
  if (it == loaded.value().profiles.end()) {
    return common::Result<Profile>::failure(not_found(key));
  }
  return common::Result<Profile>::success(it->second);
}

common::Status ProfileStore::set_profile(const std::string &key, Profile profile) const {
  if (!is_valid_profile_key(key)) {
    return common::Status::error("Invalid profile name '" + key +
                                 "': use letters, digits, '-' or '_'");
  }
  auto loaded = load_config();
  if (!loaded.ok()) {
    return common::Status::error(loaded.error());
  }
  profile.key = key;
  loaded.value().profiles[key] = std::move(profile);
  return save_config(loaded.value());
}

common::Result<bool> ProfileStore::delete_profile(const std::string &key) const {
  auto loaded = load_config();
  if (!loaded.ok()) {
    return common::Result<bool>::failure(loaded.error());
  }
  auto &config = loaded.value();
  if (config.profiles.erase(key) == 0) {
    return common::Result<bool>::success(false);
  }

  if (config.default_profile == key) {
    config.default_profile =
        config.profiles.empty() ? DEFAULT_PROFILE_KEY : config.profiles.begin()->first;
  }

  auto saved = save_config(config);
  if (!saved.ok()) {
    return common::Result<bool>::failure(saved.error());
  }
  return common::Result<bool>::success(true);
}

common::Status ProfileStore::set_default_profile(const std::string &key) const {
  auto loaded = load_config();
  if (!loaded.ok()) {
    return common::Status::error(loaded.error());
  }
  if (!loaded.value().profiles.contains(key)) {
    return common::Status::error(not_found(key));
  }
  loaded.value().default_profile = key;
  return save_config(loaded.value());
}

common::Status ProfileStore::set_session_profile(const std::string &key) {
  auto loaded = load_config();
  if (!loaded.ok()) {
    return common::Status::error(loaded.error());
  }
  if (!loaded.value().profiles.contains(key)) {
    return common::Status::error(not_found(key));
  }
  session_profile_ = key;
  return common::Status::success();
}

common::Result<std::string> ProfileStore::active_profile_name() const {
  if (session_profile_.has_value()) {
    return common::Result<std::string>::success(*session_profile_);
  }
  if (env_.profile_override.has_value()) {
    return common::Result<std::string>::success(*env_.profile_override);
  }
  auto loaded = load_config();
  if (!loaded.ok()) {
    return common::Result<std::string>::failure(loaded.error());
  }
  return common::Result<std::string>::success(loaded.value().default_profile);
}

common::Result<Profile> ProfileStore::active_profile() const {
  auto name = active_profile_name();
  if (!name.ok()) {
    return common::Result<Profile>::failure(name.error());
  }
  auto loaded = load_config();
  if (!loaded.ok()) {
    return common::Result<Profile>::failure(loaded.error());
  }
  const auto it = loaded.value().profiles.find(name.value());
  if (it == loaded.value().profiles.end()) {
    return common::Result<Profile>::failure(
        not_found(name.value()) + ". Run 'archon profile list' to see available profiles.");
  }

  Profile profile = it->second;
  if (env_.url_override.has_value()) {
    profile.url = *env_.url_override;
  }
  return common::Result<Profile>::success(std::move(profile));
}

} // namespace archon::config
