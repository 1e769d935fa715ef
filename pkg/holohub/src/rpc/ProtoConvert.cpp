// Repository: HoloHub-fleet
// Component: Proto conversion
// Copyright (c) 2025 HoloHub

#include "rpc/ProtoConvert.hpp"

namespace holohub::rpc {

namespace {

proto::PlaybackStatus StatusToProto(model::PlaybackStatus s) {
  switch (s) {
    case model::PlaybackStatus::kPlaying: return proto::PLAYBACK_STATUS_PLAYING;
    case model::PlaybackStatus::kPaused: return proto::PLAYBACK_STATUS_PAUSED;
    case model::PlaybackStatus::kStopped: return proto::PLAYBACK_STATUS_STOPPED;
    case model::PlaybackStatus::kError: return proto::PLAYBACK_STATUS_ERROR;
  }
  return proto::PLAYBACK_STATUS_UNSPECIFIED;
}

model::PlaybackStatus StatusFromProto(proto::PlaybackStatus s) {
  switch (s) {
    case proto::PLAYBACK_STATUS_PAUSED: return model::PlaybackStatus::kPaused;
    case proto::PLAYBACK_STATUS_STOPPED: return model::PlaybackStatus::kStopped;
    case proto::PLAYBACK_STATUS_ERROR: return model::PlaybackStatus::kError;
    default: return model::PlaybackStatus::kPlaying;
  }
}

}  // namespace

proto::HeartbeatRequest ToProto(const model::HeartbeatReport& r) {
  proto::HeartbeatRequest p;
  p.set_time_utc_ms(r.time_utc_ms);
  p.set_playback_status(StatusToProto(r.playback_status));
  if (r.cpu_percent) p.set_cpu_percent(*r.cpu_percent);
  if (r.memory_percent) p.set_memory_percent(*r.memory_percent);
  if (r.storage_used_gb) p.set_storage_used_gb(*r.storage_used_gb);
  if (r.temperature_celsius) p.set_temperature_celsius(*r.temperature_celsius);
  if (r.bandwidth_mbps) p.set_bandwidth_mbps(*r.bandwidth_mbps);
  if (r.latency_ms) p.set_latency_ms(*r.latency_ms);
  if (r.packet_loss_percent) p.set_packet_loss_percent(*r.packet_loss_percent);
  if (r.current_playlist_id) p.set_current_playlist_id(*r.current_playlist_id);
  if (r.current_asset_id) p.set_current_asset_id(*r.current_asset_id);
  if (r.playback_position_sec) p.set_playback_position_sec(*r.playback_position_sec);
  if (r.firmware_version) p.set_firmware_version(*r.firmware_version);
  if (r.client_version) p.set_client_version(*r.client_version);
  if (r.error_count) p.set_error_count(*r.error_count);
  if (r.last_error) p.set_last_error(*r.last_error);
  if (r.missed_heartbeats) p.set_missed_heartbeats(*r.missed_heartbeats);
  return p;
}

model::HeartbeatReport FromProto(const proto::HeartbeatRequest& p) {
  model::HeartbeatReport r;
  r.time_utc_ms = p.time_utc_ms();
  r.playback_status = StatusFromProto(p.playback_status());
  if (p.has_cpu_percent()) r.cpu_percent = p.cpu_percent();
  if (p.has_memory_percent()) r.memory_percent = p.memory_percent();
  if (p.has_storage_used_gb()) r.storage_used_gb = p.storage_used_gb();
  if (p.has_temperature_celsius()) r.temperature_celsius = p.temperature_celsius();
  if (p.has_bandwidth_mbps()) r.bandwidth_mbps = p.bandwidth_mbps();
  if (p.has_latency_ms()) r.latency_ms = p.latency_ms();
  if (p.has_packet_loss_percent()) r.packet_loss_percent = p.packet_loss_percent();
  if (p.has_current_playlist_id()) r.current_playlist_id = p.current_playlist_id();
  if (p.has_current_asset_id()) r.current_asset_id = p.current_asset_id();
  if (p.has_playback_position_sec()) r.playback_position_sec = p.playback_position_sec();
  if (p.has_firmware_version()) r.firmware_version = p.firmware_version();
  if (p.has_client_version()) r.client_version = p.client_version();
  if (p.has_error_count()) r.error_count = p.error_count();
  if (p.has_last_error()) r.last_error = p.last_error();
  if (p.has_missed_heartbeats()) r.missed_heartbeats = p.missed_heartbeats();
  return r;
}

proto::DeviceCommand ToProto(const model::DeviceCommand& c) {
  proto::DeviceCommand p;
  p.set_command_id(c.command_id);
  p.set_type(model::CommandTypeName(c.type));
  for (const auto& kv : c.params) (*p.mutable_params())[kv.first] = kv.second;
  p.set_issued_utc_ms(c.issued_utc_ms);
  return p;
}

std::optional<model::DeviceCommand> FromProto(const proto::DeviceCommand& p) {
  auto type = model::CommandTypeFromString(p.type());
  if (!type) return std::nullopt;
  model::DeviceCommand c;
  c.command_id = p.command_id();
  c.type = *type;
  for (const auto& kv : p.params()) c.params[kv.first] = kv.second;
  c.issued_utc_ms = p.issued_utc_ms();
  return c;
}

proto::Schedule ToProto(const model::Schedule& s) {
  proto::Schedule p;
  if (s.start_utc_ms) p.set_start_utc_ms(*s.start_utc_ms);
  if (s.end_utc_ms) p.set_end_utc_ms(*s.end_utc_ms);
  p.set_timezone(s.timezone);
  p.set_priority(s.priority);
  if (s.recurrence) {
    auto* r = p.mutable_recurrence();
    for (int32_t d : s.recurrence->days_of_week) r->add_days_of_week(d);
    for (const auto& range : s.recurrence->time_ranges) {
      auto* tr = r->add_time_ranges();
      tr->set_start(range.start);
      tr->set_end(range.end);
    }
  }
  return p;
}

model::Schedule FromProto(const proto::Schedule& p) {
  model::Schedule s;
  if (p.has_start_utc_ms()) s.start_utc_ms = p.start_utc_ms();
  if (p.has_end_utc_ms()) s.end_utc_ms = p.end_utc_ms();
  if (!p.timezone().empty()) s.timezone = p.timezone();
  s.priority = p.priority();
  if (p.has_recurrence()) {
    model::Recurrence r;
    for (int32_t d : p.recurrence().days_of_week()) r.days_of_week.push_back(d);
    for (const auto& tr : p.recurrence().time_ranges()) {
      model::TimeRange range;
      range.start = tr.start();
      range.end = tr.end();
      r.time_ranges.push_back(std::move(range));
    }
    s.recurrence = std::move(r);
  }
  return s;
}

proto::Playlist ToProto(const model::Playlist& pl) {
  proto::Playlist p;
  p.set_id(pl.id);
  p.set_name(pl.name);
  p.set_description(pl.description);
  p.set_loop_mode(pl.loop_mode);
  p.set_shuffle(pl.shuffle);
  p.set_transition_type(model::TransitionTypeName(pl.transition_type));
  p.set_transition_duration_ms(pl.transition_duration_ms);
  p.set_is_active(pl.is_active);
  if (pl.schedule) *p.mutable_schedule() = ToProto(*pl.schedule);
  for (const auto& item : pl.items) {
    auto* pi = p.add_items();
    pi->set_id(item.id);
    pi->set_asset_id(item.asset_id);
    pi->set_position(item.position);
    pi->set_duration_seconds(item.duration_seconds);
    if (item.transition_override) {
      pi->set_transition_override(model::TransitionTypeName(*item.transition_override));
    }
    for (const auto& kv : item.custom_settings) (*pi->mutable_custom_settings())[kv.first] = kv.second;
    auto* c = pi->mutable_content();
    c->set_content_id(item.content.content_id);
    c->set_source_path(item.content.source_path);
    c->set_declared_size(item.content.declared_size);
    c->set_mime_type(item.content.mime_type);
    c->set_expected_sha256(item.content.expected_sha256);
  }
  return p;
}

model::Playlist FromProto(const proto::Playlist& p) {
  model::Playlist pl;
  pl.id = p.id();
  pl.name = p.name();
  pl.description = p.description();
  pl.loop_mode = p.loop_mode();
  pl.shuffle = p.shuffle();
  if (auto t = model::TransitionTypeFromString(p.transition_type())) pl.transition_type = *t;
  pl.transition_duration_ms = p.transition_duration_ms();
  pl.is_active = p.is_active();
  if (p.has_schedule()) pl.schedule = FromProto(p.schedule());
  for (const auto& pi : p.items()) {
    model::PlaylistItem item;
    item.id = pi.id();
    item.asset_id = pi.asset_id();
    item.position = pi.position();
    item.duration_seconds = pi.duration_seconds();
    if (pi.has_transition_override()) {
      item.transition_override = model::TransitionTypeFromString(pi.transition_override());
    }
    for (const auto& kv : pi.custom_settings()) item.custom_settings[kv.first] = kv.second;
    item.content.content_id = pi.content().content_id();
    item.content.source_path = pi.content().source_path();
    item.content.declared_size = pi.content().declared_size();
    if (!pi.content().mime_type().empty()) item.content.mime_type = pi.content().mime_type();
    item.content.expected_sha256 = pi.content().expected_sha256();
    pl.items.push_back(std::move(item));
  }
  pl.RecomputeDerived();
  return pl;
}

}  // namespace holohub::rpc
