// Repository: HoloHub-fleet
// Component: Playlist Diff
// Purpose: Decides whether a fetched assignment differs from the last synced
//          playlist in a way that affects playback. Server-only fields
//          (names, descriptor paths, settings) are ignored.
// Copyright (c) 2025 HoloHub

#ifndef HOLOHUB_SYNC_PLAYLIST_DIFF_HPP_
#define HOLOHUB_SYNC_PLAYLIST_DIFF_HPP_

#include <string>
#include <vector>

#include "holohub/model/PlaylistTypes.hpp"

namespace holohub::sync {

enum class PlaylistChange {
  kNone = 0,
  kFirstSync,        // no previous playlist
  kIdentity,         // different playlist id
  kItemCount,
  kItemSequence,     // order, content, checksum or duration changed
};

const char* PlaylistChangeToString(PlaylistChange change);

struct PlaylistDiff {
  PlaylistChange change = PlaylistChange::kNone;
  std::vector<std::string> added_content_ids;    // referenced by next only
  std::vector<std::string> removed_content_ids;  // referenced by previous only

  bool Changed() const { return change != PlaylistChange::kNone; }
};

// previous may be null.
PlaylistDiff DiffPlaylists(const model::Playlist* previous, const model::Playlist& next);

// Content id an item resolves to (descriptor id, else asset id).
const std::string& ContentIdOf(const model::PlaylistItem& item);

}  // namespace holohub::sync

#endif  // HOLOHUB_SYNC_PLAYLIST_DIFF_HPP_
