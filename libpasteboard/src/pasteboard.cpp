/**
 * @file pasteboard.cpp
 * @brief Pasteboard handle implementation
 */

#include "pasteboard/pasteboard.h"
#include "pasteboard/log.h"

namespace pasteboard {

// ============================================================================
// Binding
// ============================================================================

/**
 * @brief One retain on a server-side pasteboard
 *
 * Shared by every copy of a handle. The retain is taken by the factory
 * before construction and dropped here.
 */
class Pasteboard::Binding {
public:
  Binding(std::shared_ptr<ClipboardService> service, std::string name)
      : service(std::move(service)), name(std::move(name)) {}

  ~Binding() { service->release(name); }

  Binding(const Binding &) = delete;
  Binding &operator=(const Binding &) = delete;

  const std::shared_ptr<ClipboardService> service;
  const std::string name;
};

namespace {

std::shared_ptr<ClipboardService>
resolve(std::shared_ptr<ClipboardService> service) {
  return service ? std::move(service) : default_service();
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

Pasteboard Pasteboard::general() { return general(default_service()); }

Pasteboard Pasteboard::general(std::shared_ptr<ClipboardService> service) {
  return named(std::move(service), PasteboardName::general());
}

Pasteboard Pasteboard::named(const PasteboardName &name) {
  return named(default_service(), name);
}

Pasteboard Pasteboard::named(std::shared_ptr<ClipboardService> service,
                             const PasteboardName &name) {
  return with(std::move(service), name.value());
}

Pasteboard Pasteboard::unique() { return unique(default_service()); }

Pasteboard Pasteboard::unique(std::shared_ptr<ClipboardService> service) {
  service = resolve(std::move(service));
  std::string name = service->retain_unique();
  return Pasteboard(
      std::make_shared<Binding>(std::move(service), std::move(name)));
}

Pasteboard Pasteboard::with(std::shared_ptr<ClipboardService> service,
                            const std::string &existing_name) {
  service = resolve(std::move(service));
  service->retain(existing_name);
  return Pasteboard(
      std::make_shared<Binding>(std::move(service), existing_name));
}

// ============================================================================
// Writes
// ============================================================================

void Pasteboard::copy_text(const std::string &text) const {
  copy_clipboard(text, PasteboardType::String);
}

void Pasteboard::copy_clipboard(const std::string &value,
                                PasteboardType type) const {
  binding_->service->set_string(binding_->name, type_identifier(type), value);
}

void Pasteboard::copy_files(const std::vector<std::string> &paths) const {
  binding_->service->write_objects(binding_->name,
                                   type_identifier(PasteboardType::FileUrl),
                                   codec::encode_file_urls(paths));
}

void Pasteboard::clear_contents() const {
  binding_->service->clear_contents(binding_->name);
}

void Pasteboard::release_globally() const {
  binding_->service->release_globally(binding_->name);
}

// ============================================================================
// Reads
// ============================================================================

Result<std::vector<Url>> Pasteboard::get_file_urls() const {
  auto items = binding_->service->read_objects(
      binding_->name, {type_identifier(PasteboardType::FileUrl)});

  // The server answers with no data at all on internal faults. That is not
  // the same as an empty pasteboard and must reach the caller.
  if (!items) {
    logging::get()->warn("Pasteboard '{}' returned no data for file URLs",
                         binding_->name);
    Error err = Error::server_no_data();
    err.location = "Pasteboard::get_file_urls";
    return err;
  }

  return codec::decode_urls(*items);
}

Result<std::vector<std::string>> Pasteboard::get_file_paths() const {
  auto urls = get_file_urls();
  if (urls.is_error()) {
    return urls.error();
  }

  std::vector<std::string> paths;
  for (const auto &url : urls.value()) {
    auto path = url.to_file_path();
    if (!path) {
      logging::get()->debug("Skipping URL without a local path: '{}'",
                            url.spec());
      continue;
    }
    paths.push_back(std::move(*path));
  }

  return paths;
}

std::optional<std::string> Pasteboard::get_text() const {
  return get_string(PasteboardType::String);
}

std::optional<std::string> Pasteboard::get_string(PasteboardType type) const {
  return binding_->service->string_for_type(binding_->name,
                                            type_identifier(type));
}

ChangeCount Pasteboard::change_count() const {
  return binding_->service->change_count(binding_->name);
}

std::vector<std::string> Pasteboard::types() const {
  return binding_->service->types(binding_->name);
}

// ============================================================================
// Identity
// ============================================================================

const std::string &Pasteboard::name() const { return binding_->name; }

const std::shared_ptr<ClipboardService> &Pasteboard::service() const {
  return binding_->service;
}

bool Pasteboard::operator==(const Pasteboard &other) const {
  return binding_->service == other.binding_->service &&
         binding_->name == other.binding_->name;
}

} // namespace pasteboard
