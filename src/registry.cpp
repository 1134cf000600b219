/*
 * castline - Podcast Generation Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "castline/registry.hpp"
#include "castline/logger.hpp"
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <random>
#include <sstream>
#include <unistd.h>

namespace castline {

CreateResult Registry::create(JobSpec spec) {
    ValidationResult valid = validate(spec);
    if (!valid) {
        LOG_DEBUG("Rejected job spec: " + valid.message);
        return {false, "", ErrorCode::Validation, valid.message};
    }

    auto entry = std::make_shared<Entry>();
    JobRecord& record = entry->record;
    record.status = Status::Pending;
    record.mode = spec.mode;
    record.text = std::move(spec.text);
    if (spec.mode == PromptMode::Audio) {
        record.inputAudio = std::make_shared<const Bytes>(std::move(spec.audio));
        record.inputAudioMime = std::move(spec.audioMime);
    }
    record.speakerCount = spec.speakers;
    record.voices = std::move(spec.voices);
    record.category = spec.category;
    record.savedCategory = spec.category;
    record.theme = std::move(spec.theme);
    record.geoLocation = std::move(spec.geoLocation);
    record.language = std::move(spec.language);
    record.useSearch = spec.useSearch;
    record.createdAt = std::chrono::system_clock::now();
    record.updatedAt = record.createdAt;

    JobId id;
    {
        std::lock_guard<std::mutex> lock(mapMutex_);
        do {
            id = generateId();
        } while (entries_.count(id) > 0);
        record.id = id;
        entries_.emplace(id, entry);
        order_.push_back(id);
    }

    LOG_INFO("Job created: " + id + " (" + toString(record.mode) + ", " +
             std::to_string(record.speakerCount) + " speaker(s))");
    return {true, id, ErrorCode::None, ""};
}

std::optional<JobRecord> Registry::get(const JobId& id) const {
    auto entry = find(id);
    if (!entry) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->removed) {
        return std::nullopt;
    }
    return entry->record;
}

bool Registry::read(const JobId& id, const Reader& reader) const {
    auto entry = find(id);
    if (!entry) {
        return false;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->removed) {
        return false;
    }
    reader(entry->record);
    return true;
}

UpdateResult Registry::update(const JobId& id, const Mutator& mutator) {
    auto entry = find(id);
    if (!entry) {
        return {false, std::nullopt, ErrorCode::NotFound, "Job not found"};
    }

    std::unique_lock<std::mutex> lock(entry->mutex);
    if (entry->removed) {
        return {false, std::nullopt, ErrorCode::NotFound, "Job not found"};
    }

    JobRecord next = entry->record;
    mutator(next);

    std::string violation = checkInvariants(entry->record, next);
    if (!violation.empty()) {
        LOG_DEBUG("Update refused for job " + id + ": " + violation);
        return {false, entry->record, ErrorCode::Conflict, violation};
    }

    next.revision = entry->record.revision + 1;
    next.updatedAt = std::chrono::system_clock::now();
    entry->record = std::move(next);
    JobRecord committed = entry->record;
    lock.unlock();

    entry->changed.notify_all();
    return {true, std::move(committed), ErrorCode::None, ""};
}

bool Registry::remove(const JobId& id) {
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(mapMutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            return false;
        }
        entry = it->second;
        // Cancel before the record disappears so the pipeline never writes
        // into a job nobody can observe.
        entry->cancel->store(true);
        entries_.erase(it);
        order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
    }

    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        entry->removed = true;
        entry->record.audio.reset();
        entry->record.inputAudio.reset();
    }
    entry->changed.notify_all();

    LOG_INFO("Job deleted: " + id);
    return true;
}

std::vector<JobRecord> Registry::list() const {
    std::vector<std::shared_ptr<Entry>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mapMutex_);
        snapshot.reserve(order_.size());
        for (const auto& id : order_) {
            auto it = entries_.find(id);
            if (it != entries_.end()) {
                snapshot.push_back(it->second);
            }
        }
    }

    std::vector<JobRecord> records;
    records.reserve(snapshot.size());
    for (const auto& entry : snapshot) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (!entry->removed) {
            records.push_back(entry->record);
        }
    }
    return records;
}

std::size_t Registry::size() const {
    std::lock_guard<std::mutex> lock(mapMutex_);
    return entries_.size();
}

WaitResult Registry::waitForRevision(const JobId& id, std::uint64_t seenRevision,
                                     std::chrono::milliseconds timeout) const {
    auto entry = find(id);
    if (!entry) {
        return WaitResult::Removed;
    }

    std::unique_lock<std::mutex> lock(entry->mutex);
    bool woke = entry->changed.wait_for(lock, timeout, [&] {
        return entry->removed || entry->record.revision > seenRevision;
    });
    if (entry->removed) {
        return WaitResult::Removed;
    }
    return woke ? WaitResult::Changed : WaitResult::Timeout;
}

CancelToken Registry::cancelToken(const JobId& id) const {
    auto entry = find(id);
    return entry ? entry->cancel : nullptr;
}

void Registry::cancelAll() noexcept {
    std::lock_guard<std::mutex> lock(mapMutex_);
    for (auto& kv : entries_) {
        kv.second->cancel->store(true);
    }
}

std::shared_ptr<Registry::Entry> Registry::find(const JobId& id) const {
    std::lock_guard<std::mutex> lock(mapMutex_);
    auto it = entries_.find(id);
    return it == entries_.end() ? nullptr : it->second;
}

JobId Registry::generateId() {
    static std::atomic<uint64_t> counter{0};
    static thread_local std::mt19937_64 rng{std::random_device{}()};

    auto now = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    uint64_t unique_counter = counter.fetch_add(1);

    std::stringstream ss;
    ss << std::hex << now << "-" << getpid() << "-" << unique_counter << "-"
       << std::setw(8) << std::setfill('0') << (rng() & 0xffffffffULL);
    return ss.str();
}

std::string Registry::checkInvariants(const JobRecord& before, const JobRecord& after) {
    if (after.id != before.id) {
        return "job id is immutable";
    }
    if (after.status != before.status && !canTransition(before.status, after.status)) {
        return std::string("illegal transition ") + toString(before.status) + " -> " + toString(after.status);
    }
    if (after.fragments.size() < before.fragments.size() ||
        !std::equal(before.fragments.begin(), before.fragments.end(), after.fragments.begin())) {
        return "transcript is append-only";
    }
    if (after.fullText.compare(0, before.fullText.size(), before.fullText) != 0) {
        return "transcript is append-only";
    }
    if (after.fragments.size() > before.fragments.size() &&
        (before.status != Status::Streaming || after.status != Status::Streaming)) {
        return "fragments are only appended while streaming";
    }
    if (after.errorCode != ErrorCode::None && after.status != Status::Error) {
        return "error code set on a job that has not failed";
    }
    if (before.truncated && !after.truncated) {
        return "truncation cannot be cleared";
    }
    if (before.title && after.title != before.title) {
        return "title is immutable once set";
    }
    if (before.audio && (!after.audio || after.audio->bytes != before.audio->bytes)) {
        return "audio is set at most once";
    }
    if (before.improvedPrompt && after.improvedPrompt != before.improvedPrompt) {
        return "improved prompt is set at most once";
    }
    if (after.text != before.text || after.inputAudio != before.inputAudio) {
        return "inputs are immutable";
    }
    return "";
}

}
