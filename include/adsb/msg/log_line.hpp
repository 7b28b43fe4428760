#pragma once
#include <string>

#include "adsb/msg/message.hpp"

namespace adsb::msg {

// CSV header matching format_log_line().
const std::string& log_header();

// One CSV row per message. Unset fields become empty cells.
std::string format_log_line(const DecodedMessage& m);

} // namespace adsb::msg
