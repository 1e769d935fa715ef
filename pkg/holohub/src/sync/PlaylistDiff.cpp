// Repository: HoloHub-fleet
// Component: Playlist Diff
// Copyright (c) 2025 HoloHub

#include "holohub/sync/PlaylistDiff.hpp"

#include <cctype>
#include <set>

namespace holohub::sync {

namespace {

std::set<std::string> ContentIds(const model::Playlist& p) {
  std::set<std::string> ids;
  for (const auto& item : p.items) ids.insert(ContentIdOf(item));
  return ids;
}

std::string ToLowerHex(const std::string& hex) {
  std::string out = hex;
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

}  // namespace

const char* PlaylistChangeToString(PlaylistChange change) {
  switch (change) {
    case PlaylistChange::kNone:         return "NONE";
    case PlaylistChange::kFirstSync:    return "FIRST_SYNC";
    case PlaylistChange::kIdentity:     return "IDENTITY";
    case PlaylistChange::kItemCount:    return "ITEM_COUNT";
    case PlaylistChange::kItemSequence: return "ITEM_SEQUENCE";
  }
  return "UNKNOWN";
}

const std::string& ContentIdOf(const model::PlaylistItem& item) {
  return item.content.content_id.empty() ? item.asset_id : item.content.content_id;
}

PlaylistDiff DiffPlaylists(const model::Playlist* previous, const model::Playlist& next) {
  PlaylistDiff diff;
  if (!previous) {
    diff.change = PlaylistChange::kFirstSync;
  } else if (previous->id != next.id) {
    diff.change = PlaylistChange::kIdentity;
  } else if (previous->item_count != next.item_count ||
             previous->items.size() != next.items.size()) {
    diff.change = PlaylistChange::kItemCount;
  } else {
    for (size_t i = 0; i < next.items.size(); ++i) {
      const auto& a = previous->items[i];
      const auto& b = next.items[i];
      if (ContentIdOf(a) != ContentIdOf(b) ||
          ToLowerHex(a.content.expected_sha256) != ToLowerHex(b.content.expected_sha256) ||
          a.duration_seconds != b.duration_seconds) {
        diff.change = PlaylistChange::kItemSequence;
        break;
      }
    }
  }
  if (!diff.Changed()) return diff;

  const std::set<std::string> after = ContentIds(next);
  const std::set<std::string> before =
      previous ? ContentIds(*previous) : std::set<std::string>{};
  for (const auto& id : after) {
    if (before.count(id) == 0) diff.added_content_ids.push_back(id);
  }
  for (const auto& id : before) {
    if (after.count(id) == 0) diff.removed_content_ids.push_back(id);
  }
  return diff;
}

}  // namespace holohub::sync
