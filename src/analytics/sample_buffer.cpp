#include "sample_buffer.hpp"
#include "core/logger.hpp"

#include <stdexcept>

namespace analytics {

SampleBuffer::SampleBuffer(size_t overflow_threshold)
    : overflow_threshold_(overflow_threshold) {
  if (overflow_threshold_ == 0)
    throw std::invalid_argument("Sample buffer overflow threshold must be > 0");
}

std::shared_ptr<SampleBuffer::KeyBuffer>
SampleBuffer::find_buffer(const std::string &key) const {
  std::shared_lock<std::shared_mutex> lock(directory_mutex_);
  auto it = buffers_.find(key);
  if (it == buffers_.end())
    return nullptr;
  return it->second;
}

std::shared_ptr<SampleBuffer::KeyBuffer>
SampleBuffer::get_or_create_buffer(const std::string &key) {
  if (auto existing = find_buffer(key))
    return existing;

  std::unique_lock<std::shared_mutex> lock(directory_mutex_);
  auto [it, inserted] = buffers_.try_emplace(key, nullptr);
  if (inserted) {
    it->second = std::make_shared<KeyBuffer>();
    LOG(LogLevel::DEBUG, LogComponent::ENGINE_INGEST,
        "Created sample buffer for key " << key);
  }
  return it->second;
}

AppendResult SampleBuffer::append(const std::string &key,
                                  const Sample &sample) {
  auto buffer = get_or_create_buffer(key);

  std::lock_guard<std::mutex> lock(buffer->mutex);
  buffer->samples.push_back(sample);

  AppendResult result;
  result.length = buffer->samples.size();
  if (result.length >= overflow_threshold_ && !buffer->overflow_signalled) {
    buffer->overflow_signalled = true;
    result.overflowed = true;
  }
  return result;
}

std::vector<Sample> SampleBuffer::drain(const std::string &key) {
  auto buffer = find_buffer(key);
  if (!buffer)
    return {};

  std::vector<Sample> drained;
  {
    std::lock_guard<std::mutex> lock(buffer->mutex);
    drained.swap(buffer->samples);
    buffer->overflow_signalled = false;
  }
  return drained;
}

std::vector<std::string> SampleBuffer::keys() const {
  std::shared_lock<std::shared_mutex> lock(directory_mutex_);
  std::vector<std::string> result;
  result.reserve(buffers_.size());
  for (const auto &entry : buffers_)
    result.push_back(entry.first);
  return result;
}

std::vector<std::string> SampleBuffer::keys_with_pending() const {
  std::shared_lock<std::shared_mutex> lock(directory_mutex_);
  std::vector<std::string> result;
  for (const auto &[key, buffer] : buffers_) {
    std::lock_guard<std::mutex> buffer_lock(buffer->mutex);
    if (!buffer->samples.empty())
      result.push_back(key);
  }
  return result;
}

size_t SampleBuffer::pending_count(const std::string &key) const {
  auto buffer = find_buffer(key);
  if (!buffer)
    return 0;
  std::lock_guard<std::mutex> lock(buffer->mutex);
  return buffer->samples.size();
}

size_t SampleBuffer::total_pending() const {
  std::shared_lock<std::shared_mutex> lock(directory_mutex_);
  size_t total = 0;
  for (const auto &entry : buffers_) {
    std::lock_guard<std::mutex> buffer_lock(entry.second->mutex);
    total += entry.second->samples.size();
  }
  return total;
}

} // namespace analytics
