// Repository: HoloHub-fleet
// Component: Playlist Catalog
// Copyright (c) 2025 HoloHub

#include "holohub/assignment/PlaylistCatalog.hpp"

#include <algorithm>
#include <set>

#include "holohub/schedule/ScheduleEvaluator.hpp"
#include "holohub/util/Logger.hpp"
#include "holohub/util/Uuid.hpp"

namespace holohub::assignment {

using util::Logger;

namespace {

std::string JoinProblems(const std::vector<std::string>& problems) {
  std::string out;
  for (const auto& p : problems) {
    if (!out.empty()) out += "; ";
    out += p;
  }
  return out;
}

bool ValidItem(const model::PlaylistItem& item) {
  return !item.asset_id.empty() && item.duration_seconds >= 0;
}

}  // namespace

PlaylistCatalog::PlaylistCatalog(std::shared_ptr<timing::ITimeSource> clock)
    : clock_(clock ? std::move(clock) : std::make_shared<timing::SystemTimeSource>()) {}

model::Playlist* PlaylistCatalog::FindMutableLocked(const std::string& playlist_id,
                                                    AssignmentError* error) {
  auto it = playlists_.find(playlist_id);
  if (it == playlists_.end()) {
    *error = AssignmentError::kPlaylistNotFound;
    return nullptr;
  }
  if (it->second.IsDeleted()) {
    *error = AssignmentError::kPlaylistDeleted;
    return nullptr;
  }
  *error = AssignmentError::kNone;
  return &it->second;
}

AssignmentResult<std::string> PlaylistCatalog::Create(model::Playlist draft) {
  if (draft.schedule) {
    auto problems = schedule::ValidateSchedule(*draft.schedule);
    if (!problems.empty()) {
      return AssignmentResult<std::string>::Fail(AssignmentError::kInvalidSchedule,
                                                 JoinProblems(problems));
    }
  }
  std::set<std::string> item_ids;
  for (auto& item : draft.items) {
    if (!ValidItem(item)) {
      return AssignmentResult<std::string>::Fail(AssignmentError::kInvalidItem,
                                                 "item without asset or negative duration");
    }
    if (item.id.empty()) item.id = util::GenerateUuidV4();
    if (!item_ids.insert(item.id).second) {
      return AssignmentResult<std::string>::Fail(AssignmentError::kInvalidItem,
                                                 "duplicate item id '" + item.id + "'");
    }
  }
  if (draft.id.empty()) draft.id = util::GenerateUuidV4();
  draft.deleted_utc_ms.reset();
  draft.RecomputeDerived();

  std::lock_guard<std::mutex> lock(mutex_);
  if (playlists_.count(draft.id) > 0) {
    return AssignmentResult<std::string>::Fail(AssignmentError::kInvalidItem,
                                               "playlist id already exists");
  }
  const std::string id = draft.id;
  Logger::Info("[PlaylistCatalog] Created " + id + " '" + draft.name + "' items=" +
               std::to_string(draft.item_count));
  playlists_.emplace(id, std::move(draft));
  return AssignmentResult<std::string>::Ok(id);
}

AssignmentResult<std::string> PlaylistCatalog::AddItem(const std::string& playlist_id,
                                                       model::PlaylistItem item,
                                                       std::optional<int32_t> position) {
  if (!ValidItem(item)) {
    return AssignmentResult<std::string>::Fail(AssignmentError::kInvalidItem);
  }
  if (item.id.empty()) item.id = util::GenerateUuidV4();

  std::lock_guard<std::mutex> lock(mutex_);
  AssignmentError err;
  model::Playlist* p = FindMutableLocked(playlist_id, &err);
  if (!p) return AssignmentResult<std::string>::Fail(err);
  const bool duplicate = std::any_of(p->items.begin(), p->items.end(),
                                     [&](const model::PlaylistItem& i) { return i.id == item.id; });
  if (duplicate) {
    return AssignmentResult<std::string>::Fail(AssignmentError::kInvalidItem,
                                               "duplicate item id '" + item.id + "'");
  }

  const int32_t n = static_cast<int32_t>(p->items.size());
  const int32_t at = position ? std::clamp(*position, 0, n) : n;
  const std::string item_id = item.id;
  p->items.insert(p->items.begin() + at, std::move(item));
  for (int32_t i = 0; i < static_cast<int32_t>(p->items.size()); ++i) p->items[i].position = i;
  p->RecomputeDerived();
  return AssignmentResult<std::string>::Ok(item_id);
}

AssignmentError PlaylistCatalog::RemoveItem(const std::string& playlist_id,
                                            const std::string& item_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  AssignmentError err;
  model::Playlist* p = FindMutableLocked(playlist_id, &err);
  if (!p) return err;
  auto it = std::find_if(p->items.begin(), p->items.end(),
                         [&](const model::PlaylistItem& i) { return i.id == item_id; });
  if (it == p->items.end()) return AssignmentError::kItemNotFound;
  p->items.erase(it);
  p->RecomputeDerived();
  return AssignmentError::kNone;
}

AssignmentError PlaylistCatalog::ReorderItems(const std::string& playlist_id,
                                              const std::vector<std::string>& item_ids) {
  std::lock_guard<std::mutex> lock(mutex_);
  AssignmentError err;
  model::Playlist* p = FindMutableLocked(playlist_id, &err);
  if (!p) return err;

  if (item_ids.size() != p->items.size() ||
      std::set<std::string>(item_ids.begin(), item_ids.end()).size() != item_ids.size()) {
    return AssignmentError::kInvalidOrder;
  }
  std::vector<model::PlaylistItem> reordered;
  reordered.reserve(item_ids.size());
  for (const auto& id : item_ids) {
    auto it = std::find_if(p->items.begin(), p->items.end(),
                           [&](const model::PlaylistItem& i) { return i.id == id; });
    if (it == p->items.end()) return AssignmentError::kInvalidOrder;
    reordered.push_back(*it);
  }
  for (int32_t i = 0; i < static_cast<int32_t>(reordered.size()); ++i) reordered[i].position = i;
  p->items = std::move(reordered);
  p->RecomputeDerived();
  return AssignmentError::kNone;
}

AssignmentError PlaylistCatalog::SetSchedule(const std::string& playlist_id,
                                             std::optional<model::Schedule> schedule) {
  if (schedule && !schedule::ValidateSchedule(*schedule).empty()) {
    return AssignmentError::kInvalidSchedule;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  AssignmentError err;
  model::Playlist* p = FindMutableLocked(playlist_id, &err);
  if (!p) return err;
  p->schedule = std::move(schedule);
  return AssignmentError::kNone;
}

AssignmentError PlaylistCatalog::SetActive(const std::string& playlist_id, bool active) {
  std::lock_guard<std::mutex> lock(mutex_);
  AssignmentError err;
  model::Playlist* p = FindMutableLocked(playlist_id, &err);
  if (!p) return err;
  p->is_active = active;
  return AssignmentError::kNone;
}

AssignmentError PlaylistCatalog::SoftDelete(const std::string& playlist_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  AssignmentError err;
  model::Playlist* p = FindMutableLocked(playlist_id, &err);
  if (!p) return err;
  p->deleted_utc_ms = clock_->NowUtcMs();
  p->is_active = false;
  Logger::Info("[PlaylistCatalog] Soft-deleted " + playlist_id);
  return AssignmentError::kNone;
}

std::optional<model::Playlist> PlaylistCatalog::Get(const std::string& playlist_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = playlists_.find(playlist_id);
  if (it == playlists_.end()) return std::nullopt;
  return it->second;
}

std::vector<model::Playlist> PlaylistCatalog::List(bool include_deleted) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<model::Playlist> out;
  for (const auto& kv : playlists_) {
    if (!include_deleted && kv.second.IsDeleted()) continue;
    out.push_back(kv.second);
  }
  return out;
}

}  // namespace holohub::assignment
