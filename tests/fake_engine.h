// In-memory PlaybackEngine that records what the manager asked of it.
#pragma once

#include "vidsync/engine.h"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace vidsync_test {

class FakeEngine : public vidsync::PlaybackEngine {
 public:
  std::optional<vidsync::SessionHandle> Launch(const std::string& media_path,
                                               vidsync::AudioOutput audio,
                                               std::string* error) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++launches_;
    last_media_ = media_path;
    last_audio_ = audio;
    if (fail_launch_) {
      if (error) {
        *error = "exec fake-player failed: No such file or directory";
      }
      return std::nullopt;
    }
    if (alive_) {
      ++overlapping_launches_;
    }
    alive_ = true;
    current_ = ++next_id_;
    return vidsync::SessionHandle{current_};
  }

  bool SendControl(const vidsync::SessionHandle& handle,
                   vidsync::ControlInstruction instruction) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!alive_ || handle.id != current_ || fail_control_) {
      return false;
    }
    instructions_.push_back(instruction);
    if (instruction == vidsync::ControlInstruction::kQuit && !ignore_quit_) {
      alive_ = false;
    }
    return true;
  }

  bool IsAlive(const vidsync::SessionHandle& handle) override {
    std::lock_guard<std::mutex> lock(mutex_);
    return alive_ && handle.id == current_;
  }

  void ForceTerminate(const vidsync::SessionHandle& handle) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (handle.id == current_) {
      ++force_terminations_;
      alive_ = false;
    }
  }

  void Release(const vidsync::SessionHandle& handle) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++releases_;
    if (handle.id == current_) {
      alive_ = false;
      current_ = -1;
    }
  }

  // Simulate the player exiting on its own.
  void Crash() {
    std::lock_guard<std::mutex> lock(mutex_);
    alive_ = false;
  }

  void SetFailLaunch(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_launch_ = fail;
  }
  void SetFailControl(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_control_ = fail;
  }
  void SetIgnoreQuit(bool ignore) {
    std::lock_guard<std::mutex> lock(mutex_);
    ignore_quit_ = ignore;
  }

  int launches() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return launches_;
  }
  int overlapping_launches() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return overlapping_launches_;
  }
  int force_terminations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return force_terminations_;
  }
  int releases() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return releases_;
  }
  std::vector<vidsync::ControlInstruction> instructions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return instructions_;
  }
  std::string last_media() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_media_;
  }
  vidsync::AudioOutput last_audio() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_audio_;
  }

 private:
  mutable std::mutex mutex_;
  bool alive_ = false;
  bool fail_launch_ = false;
  bool fail_control_ = false;
  bool ignore_quit_ = false;
  int64_t next_id_ = 0;
  int64_t current_ = -1;
  int launches_ = 0;
  int overlapping_launches_ = 0;
  int force_terminations_ = 0;
  int releases_ = 0;
  std::vector<vidsync::ControlInstruction> instructions_;
  std::string last_media_;
  vidsync::AudioOutput last_audio_ = vidsync::AudioOutput::kHdmi;
};

}  // namespace vidsync_test
