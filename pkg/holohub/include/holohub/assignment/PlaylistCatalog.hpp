// Repository: HoloHub-fleet
// Component: Playlist Catalog
// Purpose: In-memory playlist store. Every mutation renumbers item
//          positions densely and recomputes the derived fields.
// Copyright (c) 2025 HoloHub

#ifndef HOLOHUB_ASSIGNMENT_PLAYLIST_CATALOG_HPP_
#define HOLOHUB_ASSIGNMENT_PLAYLIST_CATALOG_HPP_

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "holohub/assignment/AssignmentTypes.hpp"
#include "holohub/model/PlaylistTypes.hpp"
#include "holohub/timing/ITimeSource.hpp"

namespace holohub::assignment {

class PlaylistCatalog {
 public:
  explicit PlaylistCatalog(std::shared_ptr<timing::ITimeSource> clock);

  // Stores draft (id and item ids generated when empty). Items keep their
  // relative order by position. Rejects invalid schedules.
  AssignmentResult<std::string> Create(model::Playlist draft);

  // Inserts at position (clamped to [0, n]); appends when nullopt.
  // Returns the item id.
  AssignmentResult<std::string> AddItem(const std::string& playlist_id,
                                        model::PlaylistItem item,
                                        std::optional<int32_t> position = std::nullopt);

  AssignmentError RemoveItem(const std::string& playlist_id, const std::string& item_id);

  // item_ids must name every item exactly once.
  AssignmentError ReorderItems(const std::string& playlist_id,
                               const std::vector<std::string>& item_ids);

  AssignmentError SetSchedule(const std::string& playlist_id,
                              std::optional<model::Schedule> schedule);
  AssignmentError SetActive(const std::string& playlist_id, bool active);

  AssignmentError SoftDelete(const std::string& playlist_id);

  // Includes soft-deleted playlists.
  std::optional<model::Playlist> Get(const std::string& playlist_id) const;
  std::vector<model::Playlist> List(bool include_deleted = false) const;

 private:
  // Caller holds mutex_. Null if missing; *error says why.
  model::Playlist* FindMutableLocked(const std::string& playlist_id, AssignmentError* error);

  std::shared_ptr<timing::ITimeSource> clock_;
  mutable std::mutex mutex_;
  std::map<std::string, model::Playlist> playlists_;
};

}  // namespace holohub::assignment

#endif  // HOLOHUB_ASSIGNMENT_PLAYLIST_CATALOG_HPP_
