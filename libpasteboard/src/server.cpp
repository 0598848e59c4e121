/**
 * @file server.cpp
 * @brief In-memory pasteboard server implementation
 */

#include "pasteboard/server.h"
#include "pasteboard/log.h"
#include <atomic>
#include <iomanip>
#include <map>
#include <mutex>
#include <sodium.h>
#include <sstream>
#include <variant>

namespace pasteboard {

namespace {

std::atomic<bool> g_sodium_initialized{false};

void ensure_sodium_initialized() {
  if (g_sodium_initialized.load()) {
    return;
  }

  if (sodium_init() < 0) {
    logging::get()->error("Failed to initialize libsodium");
    return;
  }

  g_sodium_initialized.store(true);
}

bool is_standard_name(const std::string &name) {
  return PasteboardName(name).is_standard();
}

} // namespace

// ============================================================================
// PasteboardServer Implementation
// ============================================================================

class PasteboardServer::Impl {
public:
  /// A value is either a single string or an ordered item list
  using Value = std::variant<std::string, std::vector<std::string>>;

  struct Store {
    std::map<std::string, Value> values;
    ChangeCount change_count = 0;
    size_t retains = 0;
    bool released = false;
  };

  mutable std::mutex mutex;
  std::map<std::string, Store> stores;
  ChangeCallback change_cb;

  Store &store_for(const std::string &name) { return stores[name]; }

  const Store *find(const std::string &name) const {
    auto it = stores.find(name);
    return it == stores.end() ? nullptr : &it->second;
  }

  // Drop a released, unbound pasteboard. Caller holds the mutex.
  void reclaim_if_unused(const std::string &name) {
    auto it = stores.find(name);
    if (it == stores.end() || is_standard_name(name)) {
      return;
    }
    if (it->second.released && it->second.retains == 0) {
      stores.erase(it);
      logging::get()->debug("Reclaimed pasteboard '{}'", name);
    }
  }

  void notify(const ChangeEvent &event) {
    ChangeCallback cb;
    {
      std::lock_guard<std::mutex> lock(mutex);
      cb = change_cb;
    }
    if (cb) {
      cb(event);
    }
  }
};

PasteboardServer::PasteboardServer() : impl_(std::make_unique<Impl>()) {
  for (const auto &name : standard_pasteboard_names()) {
    impl_->stores[name];
  }
}

PasteboardServer::~PasteboardServer() = default;

void PasteboardServer::retain(const std::string &name) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  auto &store = impl_->store_for(name);
  ++store.retains;
}

std::string PasteboardServer::retain_unique() {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  std::string name;
  do {
    name = generate_unique_name();
  } while (impl_->stores.count(name) != 0);

  impl_->stores[name].retains = 1;
  return name;
}

void PasteboardServer::release(const std::string &name) {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  auto it = impl_->stores.find(name);
  if (it == impl_->stores.end() || it->second.retains == 0) {
    logging::get()->warn("Release of unbound pasteboard '{}'", name);
    return;
  }

  --it->second.retains;
  impl_->reclaim_if_unused(name);
}

void PasteboardServer::set_string(const std::string &name,
                                  const std::string &type_id,
                                  const std::string &value) {
  ChangeEvent event;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto &store = impl_->store_for(name);
    store.values[type_id] = value;
    event.change_count = store.change_count;
  }

  event.name = name;
  event.kind = ChangeKind::StringWritten;
  event.type_id = type_id;
  event.value = value;
  impl_->notify(event);
}

void PasteboardServer::write_objects(const std::string &name,
                                     const std::string &type_id,
                                     const std::vector<std::string> &items) {
  ChangeEvent event;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto &store = impl_->store_for(name);
    store.values[type_id] = items;
    event.change_count = store.change_count;
  }

  event.name = name;
  event.kind = ChangeKind::ObjectsWritten;
  event.type_id = type_id;
  impl_->notify(event);
}

ChangeCount PasteboardServer::clear_contents(const std::string &name) {
  ChangeEvent event;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto &store = impl_->store_for(name);
    store.values.clear();
    ++store.change_count;
    event.change_count = store.change_count;
  }

  event.name = name;
  event.kind = ChangeKind::Cleared;
  impl_->notify(event);
  return event.change_count;
}

void PasteboardServer::release_globally(const std::string &name) {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  auto it = impl_->stores.find(name);
  if (it == impl_->stores.end()) {
    return;
  }

  it->second.released = true;
  impl_->reclaim_if_unused(name);
}

std::optional<std::vector<std::string>>
PasteboardServer::read_objects(const std::string &name,
                               const std::vector<std::string> &type_ids) const {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  std::vector<std::string> items;
  const auto *store = impl_->find(name);
  if (!store) {
    return items;
  }

  for (const auto &type_id : type_ids) {
    auto it = store->values.find(type_id);
    if (it == store->values.end()) {
      continue;
    }

    if (const auto *text = std::get_if<std::string>(&it->second)) {
      items.push_back(*text);
    } else {
      const auto &list = std::get<std::vector<std::string>>(it->second);
      items.insert(items.end(), list.begin(), list.end());
    }
  }

  return items;
}

std::optional<std::string>
PasteboardServer::string_for_type(const std::string &name,
                                  const std::string &type_id) const {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  const auto *store = impl_->find(name);
  if (!store) {
    return std::nullopt;
  }

  auto it = store->values.find(type_id);
  if (it == store->values.end()) {
    return std::nullopt;
  }

  if (const auto *text = std::get_if<std::string>(&it->second)) {
    return *text;
  }

  const auto &list = std::get<std::vector<std::string>>(it->second);
  if (list.empty()) {
    return std::nullopt;
  }
  return list.front();
}

ChangeCount PasteboardServer::change_count(const std::string &name) const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  const auto *store = impl_->find(name);
  return store ? store->change_count : 0;
}

std::vector<std::string>
PasteboardServer::types(const std::string &name) const {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  std::vector<std::string> result;
  const auto *store = impl_->find(name);
  if (!store) {
    return result;
  }

  for (const auto &entry : store->values) {
    result.push_back(entry.first);
  }
  return result;
}

bool PasteboardServer::contains(const std::string &name) const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->stores.count(name) != 0;
}

size_t PasteboardServer::pasteboard_count() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->stores.size();
}

size_t PasteboardServer::retain_count(const std::string &name) const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  const auto *store = impl_->find(name);
  return store ? store->retains : 0;
}

void PasteboardServer::on_change(ChangeCallback callback) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->change_cb = std::move(callback);
}

std::string PasteboardServer::generate_unique_name() {
  ensure_sodium_initialized();

  unsigned char bytes[16];
  randombytes_buf(bytes, sizeof(bytes));

  std::ostringstream oss;
  oss << "unique-" << std::hex << std::setfill('0');
  for (unsigned char byte : bytes) {
    oss << std::setw(2) << static_cast<int>(byte);
  }
  return oss.str();
}

// ============================================================================
// LocalClipboardService
// ============================================================================

LocalClipboardService::LocalClipboardService()
    : server_(shared_server()) {}

LocalClipboardService::LocalClipboardService(
    std::shared_ptr<PasteboardServer> server)
    : server_(std::move(server)) {}

std::shared_ptr<PasteboardServer> LocalClipboardService::shared_server() {
  static std::shared_ptr<PasteboardServer> server =
      std::make_shared<PasteboardServer>();
  return server;
}

void LocalClipboardService::retain(const std::string &name) {
  server_->retain(name);
}

std::string LocalClipboardService::retain_unique() {
  return server_->retain_unique();
}

void LocalClipboardService::release(const std::string &name) {
  server_->release(name);
}

void LocalClipboardService::set_string(const std::string &name,
                                       const std::string &type_id,
                                       const std::string &value) {
  server_->set_string(name, type_id, value);
}

void LocalClipboardService::write_objects(
    const std::string &name, const std::string &type_id,
    const std::vector<std::string> &items) {
  server_->write_objects(name, type_id, items);
}

ChangeCount LocalClipboardService::clear_contents(const std::string &name) {
  return server_->clear_contents(name);
}

void LocalClipboardService::release_globally(const std::string &name) {
  server_->release_globally(name);
}

std::optional<std::vector<std::string>>
LocalClipboardService::read_objects(const std::string &name,
                                    const std::vector<std::string> &type_ids) {
  return server_->read_objects(name, type_ids);
}

std::optional<std::string>
LocalClipboardService::string_for_type(const std::string &name,
                                       const std::string &type_id) {
  return server_->string_for_type(name, type_id);
}

ChangeCount LocalClipboardService::change_count(const std::string &name) {
  return server_->change_count(name);
}

std::vector<std::string>
LocalClipboardService::types(const std::string &name) {
  return server_->types(name);
}

} // namespace pasteboard
