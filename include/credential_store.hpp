/**
 * @file credential_store.hpp
 * @brief Persistent per-host credential storage.
 *
 * Credentials live in a human-editable file. HCL files hold one
 * `credentials "<host>" { token = "..." }` block per host; files ending in
 * `.json` use `{"credentials": {"<host>": {"token": "..."}}}`. Edits touch
 * only the entry being changed so comments and unrelated content survive.
 */
#ifndef HOSTLOGIN_CREDENTIAL_STORE_HPP
#define HOSTLOGIN_CREDENTIAL_STORE_HPP

#include "credential.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace hostlogin {

/// On-disk syntax of a credentials file.
enum class StoreFormat { Hcl, Json };

/// Format implied by a path (`.json` suffix selects JSON).
StoreFormat format_for_path(const std::string &path);

/// Credential entry as found in a document.
struct StoredCredential {
  std::string label; ///< Host label exactly as written
  std::string key;   ///< Comparison key, empty when the label is invalid
  std::string token;
  std::optional<std::string> refresh_token;
};

/**
 * In-memory credentials document.
 *
 * The source text is kept verbatim; edits rewrite only the affected entry.
 */
class CredentialDocument {
public:
  explicit CredentialDocument(StoreFormat format = StoreFormat::Hcl);

  /**
   * Parse document text.
   *
   * @throws HclSyntaxError or nlohmann::json::exception for malformed text,
   *         std::runtime_error for well-formed text with invalid entries.
   */
  static CredentialDocument parse(const std::string &text, StoreFormat format);

  StoreFormat format() const { return format_; }
  const std::string &text() const { return text_; }
  const std::vector<StoredCredential> &entries() const { return entries_; }
  bool empty() const { return entries_.empty(); }

  /// First entry whose label normalizes to @p key.
  std::optional<StoredCredential> find(const std::string &key) const;

  /// Replace every entry for @p key with a single entry for @p credential.
  void set(const std::string &key, const Credential &credential);

  /**
   * Remove every entry for @p key.
   *
   * @return Whether anything was removed.
   */
  bool erase(const std::string &key);

  bool operator==(const CredentialDocument &other) const {
    return format_ == other.format_ && text_ == other.text_;
  }

private:
  void reparse();
  void set_hcl(const std::string &key, const Credential &credential);
  bool erase_hcl(const std::string &key);
  void set_json(const std::string &key, const Credential &credential);
  bool erase_json(const std::string &key);

  StoreFormat format_;
  std::string text_;
  std::vector<StoredCredential> entries_;
};

/**
 * File-backed credential store.
 *
 * Writes go to a sibling temporary file that is renamed into place, so a
 * crash leaves either the old or the new document. update() additionally
 * holds an exclusive lock on `<path>.lock` across reload, edit and save.
 */
class CredentialStore {
public:
  explicit CredentialStore(std::string path);

  const std::string &path() const { return path_; }

  /**
   * Load the document.
   *
   * @return Empty document when the file does not exist.
   * @throws LoginError with ErrorKind::CorruptStore when the file cannot be
   *         read or parsed.
   */
  CredentialDocument load() const;

  /**
   * Atomically replace the file with @p doc.
   *
   * Missing parent directories are created with mode 0700 and the file is
   * written with mode 0600.
   *
   * @throws LoginError with ErrorKind::PersistFailed. The previous file is
   *         left untouched and no temporary file remains.
   */
  void save(const CredentialDocument &doc) const;

  /**
   * Locked read-modify-write cycle.
   *
   * @param edit Mutates the freshly loaded document.
   * @return The document that was saved.
   * @throws LoginError with ErrorKind::CorruptStore or
   *         ErrorKind::PersistFailed.
   */
  CredentialDocument
  update(const std::function<void(CredentialDocument &)> &edit) const;

  /// Copy of @p doc holding @p credential as the only entry for @p key.
  static CredentialDocument upsert(CredentialDocument doc,
                                   const std::string &key,
                                   const Credential &credential);

  /// Copy of @p doc without entries for @p key.
  static CredentialDocument remove(CredentialDocument doc,
                                   const std::string &key);

  /// Token stored for @p key.
  static std::optional<std::string> token_for(const CredentialDocument &doc,
                                              const std::string &key);

private:
  std::string path_;
};

} // namespace hostlogin

#endif // HOSTLOGIN_CREDENTIAL_STORE_HPP
