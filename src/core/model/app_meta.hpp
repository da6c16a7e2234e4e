#pragma once

#include <cstdint>
#include <string_view>

#ifndef HOGPEN_APP_VERSION
#define HOGPEN_APP_VERSION "1.4.0"
#endif

#ifndef HOGPEN_BUILD_RELEASE
#define HOGPEN_BUILD_RELEASE "Winter Ledger"
#endif

#ifndef HOGPEN_AUTHOR_LIST
#define HOGPEN_AUTHOR_LIST "hogpen contributors"
#endif

namespace hogpen {

inline constexpr std::string_view kAppDisplayName = "Hog Pen Casino";
inline constexpr std::string_view kCurrencyName = "coins";
inline constexpr std::string_view kCurrencySymbol = "🪙";
inline constexpr std::string_view kJournalFileName = "casino.journal";
inline constexpr std::string_view kAppVersion = HOGPEN_APP_VERSION;
inline constexpr std::string_view kBuildRelease = HOGPEN_BUILD_RELEASE;
inline constexpr std::string_view kAuthorList = HOGPEN_AUTHOR_LIST;

}  // namespace hogpen
