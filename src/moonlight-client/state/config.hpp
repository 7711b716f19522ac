#pragma once

#include <state/data-structures.hpp>
#include <string>
#include <toml.hpp>

namespace lynx::state {

/**
 * @brief Will load a configuration from the given source.
 *
 * If the source is not present, it'll provide some sensible defaults
 *
 * @throws toml::syntax_error if the file isn't valid TOML
 * @throws lynx::Error if one of the values isn't recognised
 */
Config load_or_default(const std::string &source);

/**
 * @brief same as load_or_default() but from an already parsed document
 */
Config from_toml(const toml::value &cfg);

/**
 * @return $LYNX_CFG_FOLDER/certs if set, $HOME/.config/lynx/certs otherwise
 */
std::string default_certs_folder();

/**
 * @return the video format bit for a config name like `h264` or `hevc_main10`
 */
int parse_video_format(const std::string &name);

moonlight::AudioConfiguration parse_audio_configuration(const std::string &name);

moonlight::STREAMING_MODE parse_streaming_mode(const std::string &name);

} // namespace lynx::state
