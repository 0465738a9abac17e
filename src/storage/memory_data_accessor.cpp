/**
 * @file memory_data_accessor.cpp
 * @brief Implementation of the in-memory data accessor
 */

#include <matchops/sync/storage/memory_data_accessor.h>

#include <iomanip>
#include <iterator>
#include <sstream>
#include <thread>

namespace matchops::sync {

memory_data_accessor::memory_data_accessor(std::string name)
    : name_(std::move(name)) {
}

auto memory_data_accessor::name() const -> std::string {
    return name_;
}

auto memory_data_accessor::check_transport() -> result<void> {
    if (unreachable_) {
        return unexpected(error(error_code::fatal_transport_error,
            name_ + " is unreachable"));
    }
    if (unavailable_calls_ > 0) {
        --unavailable_calls_;
        return unexpected(error(error_code::transport_unavailable,
            name_ + " is temporarily unavailable"));
    }
    return {};
}

void memory_data_accessor::simulate_latency() const {
    std::chrono::microseconds latency{0};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        latency = latency_;
    }
    if (latency.count() > 0) {
        std::this_thread::sleep_for(latency);
    }
}

void memory_data_accessor::store(item_record record) {
    auto existing = items_.find(record.id);
    if (existing != items_.end()) {
        order_.erase(std::make_pair(existing->second.priority, existing->first));
    }
    order_.emplace(record.priority, record.id);
    auto id = record.id;
    items_[id] = std::move(record);
}

auto memory_data_accessor::count() -> result<uint64_t> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto transport = check_transport(); !transport) {
        return unexpected(transport.error());
    }
    if (!count_supported_) {
        return unexpected(error(error_code::not_supported,
            name_ + " cannot count its items"));
    }
    return static_cast<uint64_t>(items_.size());
}

auto memory_data_accessor::list_item_ids(uint64_t offset, std::size_t limit)
    -> result<std::vector<std::string>> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto transport = check_transport(); !transport) {
        return unexpected(transport.error());
    }

    std::vector<std::string> ids;
    if (offset >= order_.size()) {
        return ids;
    }

    auto it = std::next(order_.begin(), static_cast<std::ptrdiff_t>(offset));
    for (; it != order_.end() && ids.size() < limit; ++it) {
        ids.push_back(it->second);
    }
    return ids;
}

auto memory_data_accessor::read_item(const std::string& id) -> result<item_record> {
    simulate_latency();

    std::lock_guard<std::mutex> lock(mutex_);
    if (auto transport = check_transport(); !transport) {
        return unexpected(transport.error());
    }
    if (failing_reads_.count(id) > 0) {
        return unexpected(error(error_code::item_transfer_error,
            "injected read failure for " + id));
    }

    auto it = items_.find(id);
    if (it == items_.end()) {
        return unexpected(error(error_code::item_not_found, id + " not found in " + name_));
    }
    return it->second;
}

auto memory_data_accessor::upsert_item(const item_record& record) -> result<void> {
    simulate_latency();

    std::lock_guard<std::mutex> lock(mutex_);
    if (auto transport = check_transport(); !transport) {
        return transport;
    }
    if (failing_writes_.count(record.id) > 0) {
        return unexpected(error(error_code::item_transfer_error,
            "injected write failure for " + record.id));
    }
    if (reject_after_ && items_.size() >= *reject_after_ &&
        items_.find(record.id) == items_.end()) {
        return {};
    }

    store(record);
    ++write_count_;
    return {};
}

auto memory_data_accessor::clear() -> result<void> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto transport = check_transport(); !transport) {
        return transport;
    }
    items_.clear();
    order_.clear();
    return {};
}

void memory_data_accessor::put(item_record record) {
    std::lock_guard<std::mutex> lock(mutex_);
    store(std::move(record));
}

void memory_data_accessor::populate(std::size_t count, const std::string& prefix,
                                    item_priority priority) {
    auto now = std::chrono::system_clock::now();
    std::lock_guard<std::mutex> lock(mutex_);
    for (std::size_t i = 1; i <= count; ++i) {
        std::ostringstream id;
        id << prefix << '-' << std::setw(5) << std::setfill('0') << i;

        item_record record;
        record.id = id.str();
        record.payload = "{\"name\":\"" + record.id + "\",\"seq\":" + std::to_string(i) + "}";
        record.updated_at = now;
        record.priority = priority;
        store(std::move(record));
    }
}

auto memory_data_accessor::contains(const std::string& id) const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.count(id) > 0;
}

auto memory_data_accessor::size() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

auto memory_data_accessor::items() const -> std::vector<item_record> {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<item_record> out;
    out.reserve(items_.size());
    for (const auto& [id, record] : items_) {
        out.push_back(record);
    }
    return out;
}

auto memory_data_accessor::write_count() const -> uint64_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return write_count_;
}

void memory_data_accessor::fail_reads_for(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    failing_reads_.insert(id);
}

void memory_data_accessor::fail_writes_for(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    failing_writes_.insert(id);
}

void memory_data_accessor::set_unavailable(uint32_t calls) {
    std::lock_guard<std::mutex> lock(mutex_);
    unavailable_calls_ = calls;
}

void memory_data_accessor::set_unreachable(bool unreachable) {
    std::lock_guard<std::mutex> lock(mutex_);
    unreachable_ = unreachable;
}

void memory_data_accessor::set_reject_after(std::optional<std::size_t> stored) {
    std::lock_guard<std::mutex> lock(mutex_);
    reject_after_ = stored;
}

void memory_data_accessor::set_count_supported(bool supported) {
    std::lock_guard<std::mutex> lock(mutex_);
    count_supported_ = supported;
}

void memory_data_accessor::set_latency(std::chrono::microseconds latency) {
    std::lock_guard<std::mutex> lock(mutex_);
    latency_ = latency;
}

}  // namespace matchops::sync
