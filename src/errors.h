#pragma once

#include <filesystem>
#include <set>
#include <stdexcept>
#include <string>

namespace tasker {

// A reference could not be put in canonical (absolute) form.
class invalid_reference : public std::invalid_argument {
 public:
  explicit invalid_reference(std::string reference);

  std::string const &reference() const { return reference_; }

 private:
  std::string reference_;
};

// A task declares the same explicit dependency/product key more than once.
class duplicate_node_name : public std::runtime_error {
 public:
  // `names` are node_key::repr() forms: names quoted, indices bare.
  duplicate_node_name(std::string kind, std::set<std::string> names);

  std::string const &kind() const { return kind_; }
  std::set<std::string> const &names() const { return names_; }

 private:
  std::string kind_;
  std::set<std::string> names_;
};

// No registered collector could classify a reference.
class node_not_collected : public std::runtime_error {
 public:
  node_not_collected(std::string reference,
                     std::string task_name,
                     std::filesystem::path path);

  std::string const &reference() const { return reference_; }
  std::string const &task_name() const { return task_name_; }
  std::filesystem::path const &path() const { return path_; }

 private:
  std::string reference_;
  std::string task_name_;
  std::filesystem::path path_;
};

// The resource behind a node is absent when its fingerprint is requested.
class node_not_found : public std::runtime_error {
 public:
  explicit node_not_found(std::filesystem::path path);

  std::filesystem::path const &path() const { return path_; }

 private:
  std::filesystem::path path_;
};

// A depends_on/produces declaration was called with the wrong arguments.
class declaration_error : public std::invalid_argument {
 public:
  declaration_error(std::string declaration, std::string const &message);

  std::string const &declaration() const { return declaration_; }

 private:
  std::string declaration_;
};

}  // namespace tasker
