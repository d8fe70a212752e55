#include "claire/core/message.hpp"

namespace claire {

std::string to_string(Role role) {
  switch (role) {
    case Role::System:
      return "system";
    case Role::User:
      return "user";
    case Role::Assistant:
      return "assistant";
  }
  return "user";
}

Role role_from_string(const std::string &str) {
  if (str == "system") return Role::System;
  if (str == "user") return Role::User;
  if (str == "assistant") return Role::Assistant;
  return Role::User;
}

Message::Message(Role role, std::string content) : role_(role), content_(std::move(content)) {}

Message Message::system(const std::string &content) {
  return Message(Role::System, content);
}

Message Message::user(const std::string &content) {
  return Message(Role::User, content);
}

Message Message::assistant(const std::string &content) {
  return Message(Role::Assistant, content);
}

json Message::to_api_format() const {
  return json{{"role", to_string(role_)}, {"content", sanitize_utf8(content_)}};
}

}  // namespace claire
