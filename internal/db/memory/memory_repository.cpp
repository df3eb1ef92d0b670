#include "memory_repository.hpp"

#include <algorithm>
#include <ranges>

#include "internal/model/state_machine.hpp"
#include "internal/scheduler/selection_policy.hpp"
#include "memory_tx.hpp"

namespace jobq::db::memory {

using jobq::model::JobState;

namespace {

bool Matches(const model::JobRecord& r, const JobFilter& filter) {
  return !filter.state || r.state == *filter.state;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this, false);
}

std::unique_ptr<db::Transaction> MemoryRepository::BeginRead() {
  return std::make_unique<MemoryTransaction>(*this, true);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result MemoryRepository::InsertJob(Transaction& t, const model::JobRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.jobs.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "job " + r.id + " already exists");
  s.jobs[r.id] = r;
  return Result::Ok();
}

std::optional<model::JobRecord> MemoryRepository::GetJob(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.jobs.find(id);
  if (it == s.jobs.end()) return std::nullopt;
  return it->second;
}

std::vector<model::JobRecord> MemoryRepository::ListJobs(Transaction& t, const JobFilter& filter) {
  std::vector<model::JobRecord> out;
  for (const auto& [_, record] : TX(t).View().jobs) {
    if (Matches(record, filter)) out.push_back(record);
  }
  std::sort(out.begin(), out.end(), [](const model::JobRecord& a, const model::JobRecord& b) {
    if (a.created_at != b.created_at) return a.created_at > b.created_at;
    return a.id < b.id;
  });
  return out;
}

Result MemoryRepository::UpdateJob(Transaction& t, const model::JobRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.jobs.find(r.id);
  if (it == s.jobs.end()) return Result::Err(ErrorCode::NotFound, "job " + r.id + " not found");
  it->second = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteJob(Transaction& t, const std::string& id) {
  auto& s = TX(t).Mutable();
  if (s.jobs.erase(id) == 0) return Result::Err(ErrorCode::NotFound, "job " + id + " not found");
  return Result::Ok();
}

Result MemoryRepository::DeleteJobs(Transaction& t, const JobFilter& filter, uint64_t& deleted) {
  auto& s = TX(t).Mutable();
  deleted = std::erase_if(s.jobs, [&](const auto& entry) { return Matches(entry.second, filter); });
  return Result::Ok();
}

Result MemoryRepository::AgeWaitingJobs(Transaction& t) {
  for (auto& [_, record] : TX(t).Mutable().jobs) {
    if (jobq::model::IsClaimable(record.state) && !record.locked_by) {
      record.waiting_time++;
    }
  }
  return Result::Ok();
}

std::optional<model::JobRecord> MemoryRepository::SelectNextClaimable(Transaction& t, util::TimePoint now) {
  return scheduler::SelectionPolicy::SelectNextIn(std::views::values(TX(t).View().jobs), now);
}

Result MemoryRepository::MarkClaimed(Transaction& t, const std::string& id, const std::string& worker_id, util::TimePoint now) {
  auto& s  = TX(t).Mutable();
  auto  it = s.jobs.find(id);
  if (it == s.jobs.end() || it->second.locked_by || !jobq::model::IsClaimable(it->second.state)) {
    return Result::Err(ErrorCode::Conflict, "job " + id + " is no longer claimable");
  }

  auto& r      = it->second;
  r.state      = JobState::kProcessing;
  r.locked_by  = worker_id;
  r.locked_at  = now;
  r.updated_at = now;
  r.next_retry_at.reset();
  return Result::Ok();
}

std::map<JobState, uint64_t> MemoryRepository::CountByState(Transaction& t) {
  std::map<JobState, uint64_t> counts;
  for (const auto& [_, record] : TX(t).View().jobs) {
    counts[record.state]++;
  }
  return counts;
}

// ------------------------------------------------------------------
// Config
// ------------------------------------------------------------------

std::optional<model::ConfigRecord> MemoryRepository::GetConfig(Transaction& t, const std::string& key) {
  const auto& s  = TX(t).View();
  auto        it = s.config.find(key);
  if (it == s.config.end()) return std::nullopt;
  return model::ConfigRecord{it->first, it->second};
}

Result MemoryRepository::PutConfig(Transaction& t, const model::ConfigRecord& r) {
  TX(t).Mutable().config[r.key] = r.value;
  return Result::Ok();
}

std::vector<model::ConfigRecord> MemoryRepository::ListConfig(Transaction& t) {
  std::vector<model::ConfigRecord> out;
  for (const auto& [key, value] : TX(t).View().config) {
    out.push_back({key, value});
  }
  return out;
}

} // namespace jobq::db::memory
