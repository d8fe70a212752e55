#pragma once

#include <string>
#include <vector>

#include "claire/core/types.hpp"

namespace claire {

enum class Role { System, User, Assistant };

std::string to_string(Role role);

Role role_from_string(const std::string &str);

// A single chat turn as exchanged with the backend
class Message {
 public:
  Message() = default;
  Message(Role role, std::string content);

  // Factory methods
  static Message system(const std::string &content);
  static Message user(const std::string &content);
  static Message assistant(const std::string &content);

  Role role() const {
    return role_;
  }

  const std::string &content() const {
    return content_;
  }

  // Synthetic flag (messages produced by the engine, e.g. spliced tool results)
  bool is_synthetic() const {
    return is_synthetic_;
  }

  void set_synthetic(bool synthetic) {
    is_synthetic_ = synthetic;
  }

  // {"role": ..., "content": ...}
  json to_api_format() const;

 private:
  Role role_ = Role::User;
  std::string content_;
  bool is_synthetic_ = false;
};

using MessageList = std::vector<Message>;

}  // namespace claire
