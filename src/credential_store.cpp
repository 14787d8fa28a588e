#include "credential_store.hpp"
#include "errors.hpp"
#include "hcl_scanner.hpp"
#include "log.hpp"

#include <cctype>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace hostlogin {

namespace fs = std::filesystem;

namespace {

constexpr const char *kBlockType = "credentials";

std::shared_ptr<spdlog::logger> store_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("store");
  }();
  return logger;
}

/// Comparison key of a stored label; empty for labels that do not normalize.
std::string label_key(const std::string &label) {
  if (label.find_first_not_of(" \t") == std::string::npos) {
    return {};
  }
  try {
    return for_comparison(label);
  } catch (const LoginError &e) {
    store_log()->debug("Ignoring credentials for invalid host label: {}",
                       e.what());
    return {};
  }
}

bool is_credentials_block(const HclBlock &block) {
  return block.type == kBlockType && block.labels.size() == 1;
}

std::string render_hcl_block(const std::string &key,
                             const Credential &credential) {
  std::string out = std::string(kBlockType) + " " + hcl_quote(key) + " {\n";
  out += "  token = " + hcl_quote(credential.token) + "\n";
  if (credential.refresh_token) {
    out += "  refresh_token = " + hcl_quote(*credential.refresh_token) + "\n";
  }
  out += "}";
  return out;
}

/**
 * Remove the text of a block. When the block occupies whole lines those
 * lines go too, along with one adjoining blank line.
 */
void erase_span(std::string &text, std::size_t begin, std::size_t end) {
  std::size_t start = begin;
  while (start > 0 && (text[start - 1] == ' ' || text[start - 1] == '\t')) {
    --start;
  }
  std::size_t stop = end;
  while (stop < text.size() &&
         (text[stop] == ' ' || text[stop] == '\t' || text[stop] == '\r')) {
    ++stop;
  }
  bool line_start = start == 0 || text[start - 1] == '\n';
  bool line_end = stop == text.size() || text[stop] == '\n';
  if (!line_start || !line_end) {
    text.erase(begin, end - begin);
    return;
  }
  if (stop < text.size()) {
    ++stop;
  }
  bool blank_before = start == 0 || (start >= 2 && text[start - 2] == '\n');
  if (blank_before) {
    if (stop < text.size() && text[stop] == '\n') {
      ++stop;
    } else if (stop == text.size() && start >= 2) {
      --start;
    }
  }
  text.erase(start, stop - start);
}

nlohmann::ordered_json credential_json(const Credential &credential) {
  nlohmann::ordered_json entry = nlohmann::ordered_json::object();
  entry["token"] = credential.token;
  if (credential.refresh_token) {
    entry["refresh_token"] = *credential.refresh_token;
  }
  return entry;
}

bool is_blank(const std::string &text) {
  return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

nlohmann::ordered_json parse_json_text(const std::string &text) {
  if (is_blank(text)) {
    return nlohmann::ordered_json::object();
  }
  return nlohmann::ordered_json::parse(text);
}

/**
 * Sibling temporary file that is removed unless committed.
 */
class ScopedTempFile {
public:
  explicit ScopedTempFile(const fs::path &target) {
    std::string pattern = target.string() + ".tmp.XXXXXX";
    std::vector<char> name(pattern.begin(), pattern.end());
    name.push_back('\0');
    fd_ = ::mkstemp(name.data());
    if (fd_ < 0) {
      throw std::system_error(errno, std::generic_category(),
                              "cannot create temporary file next to " +
                                  target.string());
    }
    path_ = name.data();
    ::fchmod(fd_, S_IRUSR | S_IWUSR);
  }

  ~ScopedTempFile() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    if (!committed_) {
      ::unlink(path_.c_str());
    }
  }

  ScopedTempFile(const ScopedTempFile &) = delete;
  ScopedTempFile &operator=(const ScopedTempFile &) = delete;

  void write(const std::string &data) {
    std::size_t written = 0;
    while (written < data.size()) {
      ssize_t n = ::write(fd_, data.data() + written, data.size() - written);
      if (n < 0) {
        if (errno == EINTR) {
          continue;
        }
        throw std::system_error(errno, std::generic_category(),
                                "cannot write " + path_);
      }
      written += static_cast<std::size_t>(n);
    }
  }

  /// Flush to disk and rename over @p target.
  void commit(const fs::path &target) {
    if (::fsync(fd_) != 0) {
      throw std::system_error(errno, std::generic_category(),
                              "cannot flush " + path_);
    }
    int rc = ::close(fd_);
    fd_ = -1;
    if (rc != 0) {
      throw std::system_error(errno, std::generic_category(),
                              "cannot close " + path_);
    }
    if (::rename(path_.c_str(), target.c_str()) != 0) {
      throw std::system_error(errno, std::generic_category(),
                              "cannot replace " + target.string());
    }
    committed_ = true;
  }

  const std::string &path() const { return path_; }

private:
  int fd_ = -1;
  std::string path_;
  bool committed_ = false;
};

/// Exclusive advisory lock held for the lifetime of the object.
class StoreLock {
public:
  explicit StoreLock(const std::string &path) {
    fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC,
                 S_IRUSR | S_IWUSR);
    if (fd_ < 0) {
      throw std::system_error(errno, std::generic_category(),
                              "cannot open lock file " + path);
    }
    while (::flock(fd_, LOCK_EX) != 0) {
      if (errno != EINTR) {
        int err = errno;
        ::close(fd_);
        throw std::system_error(err, std::generic_category(),
                                "cannot lock " + path);
      }
    }
  }

  ~StoreLock() {
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
  }

  StoreLock(const StoreLock &) = delete;
  StoreLock &operator=(const StoreLock &) = delete;

private:
  int fd_ = -1;
};

void fsync_directory(const fs::path &dir) {
  int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd < 0) {
    store_log()->debug("Cannot open {} to flush it", dir.string());
    return;
  }
  if (::fsync(fd) != 0) {
    store_log()->debug("Flushing directory {} failed", dir.string());
  }
  ::close(fd);
}

fs::path parent_of(const std::string &path) {
  fs::path parent = fs::path(path).parent_path();
  return parent.empty() ? fs::path(".") : parent;
}

/// Create missing directories with owner-only permissions.
void create_private_directories(const fs::path &dir) {
  std::vector<fs::path> missing;
  for (fs::path p = dir; !p.empty() && !fs::exists(p); p = p.parent_path()) {
    missing.push_back(p);
    if (p == p.parent_path()) {
      break;
    }
  }
  for (auto it = missing.rbegin(); it != missing.rend(); ++it) {
    fs::create_directory(*it);
    fs::permissions(*it, fs::perms::owner_all, fs::perm_options::replace);
    store_log()->debug("Created directory {}", it->string());
  }
  if (!fs::is_directory(dir)) {
    throw fs::filesystem_error(
        "not a directory", dir,
        std::make_error_code(std::errc::not_a_directory));
  }
}

void ensure_parent(const std::string &path) {
  fs::path dir = parent_of(path);
  try {
    create_private_directories(dir);
  } catch (const fs::filesystem_error &) {
    std::throw_with_nested(LoginError(
        ErrorKind::PersistFailed,
        "Cannot create the directory " + dir.string() +
            " for the credentials file " + path + "."));
  }
}

} // namespace

StoreFormat format_for_path(const std::string &path) {
  std::string ext = fs::path(path).extension().string();
  for (auto &c : ext) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return ext == ".json" ? StoreFormat::Json : StoreFormat::Hcl;
}

CredentialDocument::CredentialDocument(StoreFormat format) : format_(format) {}

CredentialDocument CredentialDocument::parse(const std::string &text,
                                             StoreFormat format) {
  CredentialDocument doc(format);
  doc.text_ = text;
  doc.reparse();
  return doc;
}

void CredentialDocument::reparse() {
  std::vector<StoredCredential> entries;
  if (format_ == StoreFormat::Hcl) {
    for (const auto &block : scan_hcl_blocks(text_)) {
      if (block.type != kBlockType) {
        continue;
      }
      if (block.labels.size() != 1) {
        throw std::runtime_error(
            "a credentials block must have exactly one host label");
      }
      StoredCredential entry;
      entry.label = block.labels.front();
      entry.key = label_key(entry.label);
      entry.token = block.string_attribute("token").value_or("");
      entry.refresh_token = block.string_attribute("refresh_token");
      entries.push_back(std::move(entry));
    }
  } else {
    nlohmann::ordered_json doc = parse_json_text(text_);
    if (!doc.is_object()) {
      throw std::runtime_error("the document must be a JSON object");
    }
    auto creds = doc.find("credentials");
    if (creds != doc.end()) {
      if (!creds->is_object()) {
        throw std::runtime_error("\"credentials\" must be an object");
      }
      for (const auto &item : creds->items()) {
        const std::string &label = item.key();
        const auto &value = item.value();
        if (!value.is_object()) {
          throw std::runtime_error("credentials for \"" + label +
                                   "\" must be an object");
        }
        StoredCredential entry;
        entry.label = label;
        entry.key = label_key(label);
        if (auto token = value.find("token"); token != value.end()) {
          if (!token->is_string()) {
            throw std::runtime_error("the token for \"" + label +
                                     "\" must be a string");
          }
          entry.token = token->get<std::string>();
        }
        if (auto refresh = value.find("refresh_token");
            refresh != value.end() && refresh->is_string()) {
          entry.refresh_token = refresh->get<std::string>();
        }
        entries.push_back(std::move(entry));
      }
    }
  }
  entries_ = std::move(entries);
}

std::optional<StoredCredential>
CredentialDocument::find(const std::string &key) const {
  for (const auto &entry : entries_) {
    if (!entry.key.empty() && entry.key == key) {
      return entry;
    }
  }
  return std::nullopt;
}

void CredentialDocument::set(const std::string &key,
                             const Credential &credential) {
  if (format_ == StoreFormat::Hcl) {
    set_hcl(key, credential);
  } else {
    set_json(key, credential);
  }
  reparse();
}

bool CredentialDocument::erase(const std::string &key) {
  bool removed =
      format_ == StoreFormat::Hcl ? erase_hcl(key) : erase_json(key);
  if (removed) {
    reparse();
  }
  return removed;
}

void CredentialDocument::set_hcl(const std::string &key,
                                 const Credential &credential) {
  auto blocks = scan_hcl_blocks(text_);
  std::vector<const HclBlock *> matches;
  for (const auto &block : blocks) {
    if (is_credentials_block(block) && label_key(block.labels[0]) == key) {
      matches.push_back(&block);
    }
  }
  std::string rendered = render_hcl_block(key, credential);
  if (matches.empty()) {
    if (!text_.empty()) {
      if (text_.back() != '\n') {
        text_ += '\n';
      }
      text_ += '\n';
    }
    text_ += rendered;
    text_ += '\n';
    return;
  }
  for (std::size_t i = matches.size(); i-- > 1;) {
    erase_span(text_, matches[i]->begin, matches[i]->end);
  }
  text_.replace(matches[0]->begin, matches[0]->end - matches[0]->begin,
                rendered);
}

bool CredentialDocument::erase_hcl(const std::string &key) {
  auto blocks = scan_hcl_blocks(text_);
  bool removed = false;
  for (auto it = blocks.rbegin(); it != blocks.rend(); ++it) {
    if (is_credentials_block(*it) && label_key(it->labels[0]) == key) {
      erase_span(text_, it->begin, it->end);
      removed = true;
    }
  }
  return removed;
}

void CredentialDocument::set_json(const std::string &key,
                                  const Credential &credential) {
  nlohmann::ordered_json doc = parse_json_text(text_);
  auto &creds = doc["credentials"];
  if (creds.is_null()) {
    creds = nlohmann::ordered_json::object();
  }
  std::vector<std::string> matches;
  for (const auto &item : creds.items()) {
    if (label_key(item.key()) == key) {
      matches.push_back(item.key());
    }
  }
  bool in_place = !matches.empty() && matches.front() == key;
  for (const auto &name : matches) {
    if (!(in_place && name == key)) {
      creds.erase(name);
    }
  }
  creds[key] = credential_json(credential);
  text_ = doc.dump(2) + "\n";
}

bool CredentialDocument::erase_json(const std::string &key) {
  nlohmann::ordered_json doc = parse_json_text(text_);
  auto creds = doc.find("credentials");
  if (creds == doc.end() || !creds->is_object()) {
    return false;
  }
  std::vector<std::string> matches;
  for (const auto &item : creds->items()) {
    if (label_key(item.key()) == key) {
      matches.push_back(item.key());
    }
  }
  for (const auto &name : matches) {
    creds->erase(name);
  }
  if (!matches.empty()) {
    text_ = doc.dump(2) + "\n";
  }
  return !matches.empty();
}

CredentialStore::CredentialStore(std::string path) : path_(std::move(path)) {}

CredentialDocument CredentialStore::load() const {
  StoreFormat format = format_for_path(path_);
  std::error_code ec;
  auto status = fs::status(path_, ec);
  if (status.type() == fs::file_type::not_found) {
    store_log()->debug("Credentials file {} does not exist yet", path_);
    return CredentialDocument(format);
  }
  if (ec || !fs::is_regular_file(status)) {
    throw LoginError(ErrorKind::CorruptStore,
                     "The credentials file " + path_ +
                         " is not a readable regular file.");
  }
  std::ifstream in(path_, std::ios::binary);
  if (!in) {
    throw LoginError(ErrorKind::CorruptStore,
                     "Cannot read the credentials file " + path_ + ".");
  }
  std::string content((std::istreambuf_iterator<char>(in)),
                      std::istreambuf_iterator<char>());
  if (in.bad()) {
    throw LoginError(ErrorKind::CorruptStore,
                     "Cannot read the credentials file " + path_ + ".");
  }
  try {
    auto doc = CredentialDocument::parse(content, format);
    store_log()->debug("Loaded {} credential(s) from {}", doc.entries().size(),
                       path_);
    return doc;
  } catch (const std::exception &) {
    std::throw_with_nested(
        LoginError(ErrorKind::CorruptStore,
                   "The credentials file " + path_ +
                       " is not valid; fix or remove it and try again."));
  }
}

void CredentialStore::save(const CredentialDocument &doc) const {
  ensure_parent(path_);
  fs::path target(path_);
  try {
    ScopedTempFile temp(target);
    temp.write(doc.text());
    temp.commit(target);
  } catch (const std::system_error &) {
    std::throw_with_nested(LoginError(
        ErrorKind::PersistFailed,
        "Failed to save credentials to " + path_ + "."));
  }
  fsync_directory(parent_of(path_));
  store_log()->info("Saved {} credential(s) to {}", doc.entries().size(),
                    path_);
}

CredentialDocument CredentialStore::update(
    const std::function<void(CredentialDocument &)> &edit) const {
  ensure_parent(path_);
  std::unique_ptr<StoreLock> lock;
  try {
    lock = std::make_unique<StoreLock>(path_ + ".lock");
  } catch (const std::system_error &) {
    std::throw_with_nested(LoginError(
        ErrorKind::PersistFailed,
        "Cannot lock the credentials file " + path_ + "."));
  }
  CredentialDocument doc = load();
  CredentialDocument before = doc;
  edit(doc);
  if (doc == before) {
    store_log()->debug("Credentials file {} already up to date", path_);
    return doc;
  }
  save(doc);
  return doc;
}

CredentialDocument CredentialStore::upsert(CredentialDocument doc,
                                           const std::string &key,
                                           const Credential &credential) {
  doc.set(key, credential);
  return doc;
}

CredentialDocument CredentialStore::remove(CredentialDocument doc,
                                           const std::string &key) {
  doc.erase(key);
  return doc;
}

std::optional<std::string>
CredentialStore::token_for(const CredentialDocument &doc,
                           const std::string &key) {
  auto entry = doc.find(key);
  if (!entry || entry->token.empty()) {
    return std::nullopt;
  }
  return entry->token;
}

} // namespace hostlogin
