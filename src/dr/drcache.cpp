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

#include "config.h"

#include <cstddef>
#include <iterator>
#include <chrono>
#include <optional>

#include <boost/multi_index/hashed_index.hpp>
#include <boost/multi_index/indexed_by.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/ordered_index.hpp>
#include <boost/multi_index/tag.hpp>
#include <boost/multi_index_container.hpp>

#include <QtGlobal>
#include <QString>
#include <QHash>
#include <QReadLocker>
#include <QWriteLocker>

#include "core/logging.h"
#include "drcache.h"

using boost::multi_index::hashed_unique;
using boost::multi_index::indexed_by;
using boost::multi_index::member;
using boost::multi_index::multi_index_container;
using boost::multi_index::ordered_non_unique;
using boost::multi_index::ordered_unique;
using boost::multi_index::tag;

using namespace std::chrono_literals;

const std::chrono::milliseconds DrCache::kDefaultTtl = 1h;

class DrCachePrivate {
 public:
  struct Entry {
    QString album_path;
    QString dr_value;
    qint64 expires_at;
  };

  struct tag_by_path {};
  struct tag_by_expiry {};
  struct tag_by_path_order {};

  struct PathHash {
    std::size_t operator()(const QString &path) const { return qHash(path); }
  };

  using EntryContainer = multi_index_container<Entry, indexed_by<hashed_unique<tag<tag_by_path>, member<Entry, QString, &Entry::album_path>, PathHash>, ordered_non_unique<tag<tag_by_expiry>, member<Entry, qint64, &Entry::expires_at>>, ordered_unique<tag<tag_by_path_order>, member<Entry, QString, &Entry::album_path>>>>;

  EntryContainer entries_;
};

DrCache::DrCache(const std::chrono::milliseconds ttl) : ttl_(ttl), p_(new DrCachePrivate) {

  timer_.start();

}

DrCache::~DrCache() = default;

std::optional<QString> DrCache::Get(const QString &album_path) const {

  QReadLocker l(&lock_);

  const auto &index = p_->entries_.get<DrCachePrivate::tag_by_path>();
  const auto it = index.find(album_path);
  if (it == index.end() || it->expires_at <= now()) {
    return std::nullopt;
  }

  return it->dr_value;

}

void DrCache::Insert(const QString &album_path, const QString &dr_value) {

  QWriteLocker l(&lock_);

  PruneExpired();

  const DrCachePrivate::Entry entry{album_path, dr_value, now() + ttl_.count()};
  auto &index = p_->entries_.get<DrCachePrivate::tag_by_path>();
  const auto it = index.find(album_path);
  if (it == index.end()) {
    index.insert(entry);
  }
  else {
    index.replace(it, entry);
  }

}

void DrCache::Remove(const QString &album_path) {

  QWriteLocker l(&lock_);

  PruneExpired();
  p_->entries_.get<DrCachePrivate::tag_by_path>().erase(album_path);

}

void DrCache::RemoveTree(const QString &path) {

  QWriteLocker l(&lock_);

  PruneExpired();

  QString prefix = path;
  while (prefix.length() > 1 && prefix.endsWith(u'/')) prefix.chop(1);

  auto &paths = p_->entries_.get<DrCachePrivate::tag_by_path>();
  paths.erase(prefix);

  // Everything below the directory sorts in one run after "prefix/".
  if (!prefix.endsWith(u'/')) prefix += u'/';
  auto &index = p_->entries_.get<DrCachePrivate::tag_by_path_order>();
  auto it = index.lower_bound(prefix);
  while (it != index.end() && it->album_path.startsWith(prefix)) {
    it = index.erase(it);
  }

}

void DrCache::Clear() {

  QWriteLocker l(&lock_);
  p_->entries_.clear();

}

int DrCache::size() const {

  QReadLocker l(&lock_);

  // Entries in expiry order, everything past the current time is alive.
  const auto &index = p_->entries_.get<DrCachePrivate::tag_by_expiry>();
  return static_cast<int>(std::distance(index.upper_bound(now()), index.end()));

}

void DrCache::PruneExpired() {

  auto &index = p_->entries_.get<DrCachePrivate::tag_by_expiry>();
  const auto end = index.upper_bound(now());
  const auto pruned = std::distance(index.begin(), end);
  if (pruned > 0) {
    index.erase(index.begin(), end);
    qLog(Debug) << "Pruned" << pruned << "expired DR cache entries";
  }

}
