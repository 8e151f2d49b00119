#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

// Bounded thread-safe queue. In overwrite mode a full channel drops its
// oldest entry instead of blocking the sender, which makes it a rolling
// history buffer.
template<typename T>
class BufferedChannel {
  public:
    BufferedChannel(size_t capacity = 1, bool overwrite = false)
        : cap_(capacity), has_overwrite_(overwrite) {};
    void send(const T& message);
    T receive();
    bool isEmpty();
    size_t size();
    std::vector<T> items();
    std::string snapshot();
  private:
    std::deque<T> q_;
    size_t cap_;
    bool has_overwrite_;

    std::mutex messageMtx_;
    std::condition_variable messageCvEmpty_; // waiting for messages
    std::condition_variable messageCvFull_;  // waiting for space
};


template<typename T>
size_t BufferedChannel<T>::size(){
  std::lock_guard<std::mutex> lock(messageMtx_);
  return this->q_.size();
}


template<typename T>
void BufferedChannel<T>::send(const T& message) {
  std::unique_lock<std::mutex> lock(messageMtx_);

  if (!has_overwrite_) {
      // Wait if full
      messageCvFull_.wait(lock, [&]() {
          return q_.size() < cap_;
      });
  } else {
      // Overwrite mode: if full, erase oldest
      if (q_.size() >= cap_) {
          q_.pop_front();
      }
  }

  q_.push_back(message);
  messageCvEmpty_.notify_one();
}

template<typename T>
T BufferedChannel<T>::receive() {
  std::unique_lock<std::mutex> lock(messageMtx_);

  messageCvEmpty_.wait(lock, [&]() {
      return !q_.empty();
  });

  T value = q_.front();
  q_.pop_front();

  // Notify senders waiting for space
  messageCvFull_.notify_one();

  return value;
}

template<typename T>
bool BufferedChannel<T>::isEmpty() {
  std::lock_guard<std::mutex> lock(messageMtx_);
  return q_.empty();
}

template<typename T>
std::vector<T> BufferedChannel<T>::items() {
  std::lock_guard<std::mutex> lock(messageMtx_);
  return std::vector<T>(q_.begin(), q_.end());
}

// One entry per line, oldest first.
template<typename T>
std::string BufferedChannel<T>::snapshot() {
  std::lock_guard<std::mutex> lock(messageMtx_);

  std::ostringstream oss;
  for (const auto& item : q_) {
      oss << item << "\n";
  }
  return oss.str();
}
