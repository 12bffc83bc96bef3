/*
 * Quaver Music Library
 * Copyright 2024-2026, Quaver developers
 *
 * Quaver is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Quaver is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Quaver.  If not, see <http://www.gnu.org/licenses/>.
 *
 */

#ifndef LIBRARYSETTINGS_H
#define LIBRARYSETTINGS_H

namespace LibrarySettings {

constexpr char kSettingsGroup[] = "Library";

constexpr char kDirectories[] = "directories";
constexpr char kDatabase[] = "database";
constexpr char kDebounceDelay[] = "debounce_delay_ms";
constexpr char kMaxBatchSize[] = "max_batch_size";
constexpr char kDrParsing[] = "dr_parsing";
constexpr char kDrCacheTtl[] = "dr_cache_ttl_secs";
constexpr char kIncludeHidden[] = "include_hidden";

constexpr int kDebounceDelayDefault = 500;
constexpr int kMaxBatchSizeDefault = 50;
constexpr bool kDrParsingDefault = true;
constexpr int kDrCacheTtlDefault = 3600;
constexpr bool kIncludeHiddenDefault = false;

// Bounded queues between the watcher, the debouncer and the synchronizer.
constexpr int kChangeChannelCapacity = 1024;
constexpr int kBatchChannelCapacity = 64;

}  // namespace LibrarySettings

#endif  // LIBRARYSETTINGS_H
