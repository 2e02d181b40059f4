#include "runtime/disaggregated/transfer_session.h"

#include "runtime/errors.h"
#include "server/logging/logger.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <new>
#include <sstream>
#include <thread>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace pdserve {
namespace disaggregated {

namespace {

using json = nlohmann::json;

constexpr uint32_t kSegmentMagic = 0x50445846;  // "PDXF"
constexpr uint32_t kSegmentVersion = 2;
constexpr int kHandleVersion = 1;

// How long releasing an operation waits for a peer that is mid-copy before
// the descriptor is quarantined instead of reused.
constexpr std::chrono::seconds kInProgressGrace{10};

// Placed at offset 0 of every segment; the payload follows.  Only lock-free
// atomics are shared across processes.
//
// `control` packs the operation generation (high 56 bits) with its
// TransferState (low 8 bits).  Every transition is a CAS on the whole word,
// so a peer holding an old generation can never claim or complete a later
// operation on the same descriptor.
struct SegmentHeader {
  uint32_t magic;
  uint32_t version;
  std::atomic<uint64_t> control;
  std::atomic<uint32_t> kind;
  uint32_t reserved;
  uint64_t payload_size;
  std::atomic<uint64_t> bytes_transferred;
};

static_assert(std::atomic<uint32_t>::is_always_lock_free, "shared state must be lock-free");
static_assert(std::atomic<uint64_t>::is_always_lock_free, "shared state must be lock-free");

constexpr uint64_t Pack(uint64_t generation, TransferState state) {
  return (generation << 8) | static_cast<uint64_t>(state);
}
constexpr uint64_t GenerationOf(uint64_t word) { return word >> 8; }
constexpr TransferState StateOf(uint64_t word) { return static_cast<TransferState>(word & 0xff); }

constexpr std::size_t kPayloadOffset = (sizeof(SegmentHeader) + 63) / 64 * 64;

// Process-level counter to make segment names unique within a namespace.
std::atomic<uint64_t> g_segment_seq{0};

std::string SanitizeNamespace(const std::string &ns) {
  std::string out;
  out.reserve(ns.size());
  for (char c : ns) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                    (c >= '0' && c <= '9') || c == '_' || c == '-';
    out.push_back(ok ? c : '_');
  }
  return out.empty() ? "default" : out;
}

const char *KindName(OperationKind kind) {
  switch (kind) {
  case OperationKind::kWrite:
    return "write";
  case OperationKind::kRead:
    return "read";
  case OperationKind::kNone:
    break;
  }
  return "none";
}

OperationKind ParseKind(const std::string &name) {
  if (name == "write") return OperationKind::kWrite;
  if (name == "read") return OperationKind::kRead;
  throw TransferError("unknown operation kind '" + name + "'");
}

}  // namespace

// Which shm object a name is bound to.  A restarted owner can reuse a name
// (same pid), so peers compare identities, not names.
struct ShmIdentity {
  dev_t dev{0};
  ino_t ino{0};

  bool operator==(const ShmIdentity &other) const {
    return dev == other.dev && ino == other.ino;
  }
};

// A mapped segment.  The creating side unlinks the name on destruction;
// peers only unmap.
class ShmSegment {
 public:
  static std::shared_ptr<ShmSegment> Create(const std::string &name, std::size_t payload_size) {
    const std::size_t total = kPayloadOffset + payload_size;
    int fd = ::shm_open(name.c_str(), O_CREAT | O_RDWR | O_EXCL, 0600);
    if (fd < 0) {
      throw TransferError("shm_open(create) failed for " + name + ": " + std::strerror(errno));
    }
    if (::ftruncate(fd, static_cast<off_t>(total)) != 0) {
      const std::string err = std::strerror(errno);
      ::close(fd);
      ::shm_unlink(name.c_str());
      throw TransferError("ftruncate failed for " + name + ": " + err);
    }
    void *ptr = ::mmap(nullptr, total, PROT_READ | PROT_WRITE, MAP_SHARED, fd, 0);
    ::close(fd);
    if (ptr == MAP_FAILED) {
      const std::string err = std::strerror(errno);
      ::shm_unlink(name.c_str());
      throw TransferError("mmap(create) failed for " + name + ": " + err);
    }
    auto *header = new (ptr) SegmentHeader;
    header->magic = kSegmentMagic;
    header->version = kSegmentVersion;
    header->control.store(Pack(0, TransferState::kIdle), std::memory_order_relaxed);
    header->kind.store(static_cast<uint32_t>(OperationKind::kNone), std::memory_order_relaxed);
    header->reserved = 0;
    header->payload_size = payload_size;
    header->bytes_transferred.store(0, std::memory_order_release);
    return std::shared_ptr<ShmSegment>(new ShmSegment(name, ptr, total, true, ShmIdentity{}));
  }

  // False if nothing is bound to `name` any more.
  static bool Stat(const std::string &name, ShmIdentity *out) {
    int fd = ::shm_open(name.c_str(), O_RDONLY, 0);
    if (fd < 0) return false;
    struct stat st {};
    const bool ok = ::fstat(fd, &st) == 0;
    ::close(fd);
    if (ok) *out = ShmIdentity{st.st_dev, st.st_ino};
    return ok;
  }

  static std::shared_ptr<ShmSegment> Open(const std::string &name) {
    int fd = ::shm_open(name.c_str(), O_RDWR, 0);
    if (fd < 0) {
      throw TransferError("shm_open(open) failed for " + name + ": " + std::strerror(errno));
    }
    struct stat st {};
    if (::fstat(fd, &st) != 0 || static_cast<std::size_t>(st.st_size) < kPayloadOffset) {
      ::close(fd);
      throw TransferError("segment " + name + " is truncated");
    }
    const std::size_t total = static_cast<std::size_t>(st.st_size);
    void *ptr = ::mmap(nullptr, total, PROT_READ | PROT_WRITE, MAP_SHARED, fd, 0);
    ::close(fd);
    if (ptr == MAP_FAILED) {
      throw TransferError("mmap(open) failed for " + name + ": " + std::strerror(errno));
    }
    auto segment = std::shared_ptr<ShmSegment>(
        new ShmSegment(name, ptr, total, false, ShmIdentity{st.st_dev, st.st_ino}));
    if (segment->Header()->magic != kSegmentMagic ||
        segment->Header()->version != kSegmentVersion) {
      throw TransferError("segment " + name + " has an unknown layout");
    }
    return segment;
  }

  ~ShmSegment() {
    ::munmap(base_, total_);
    if (owner_) ::shm_unlink(name_.c_str());
  }

  ShmSegment(const ShmSegment &) = delete;
  ShmSegment &operator=(const ShmSegment &) = delete;

  SegmentHeader *Header() { return static_cast<SegmentHeader *>(base_); }
  uint8_t *Payload() { return static_cast<uint8_t *>(base_) + kPayloadOffset; }
  std::size_t PayloadSize() const { return total_ - kPayloadOffset; }
  const std::string &Name() const { return name_; }
  const ShmIdentity &Identity() const { return identity_; }

 private:
  ShmSegment(std::string name, void *base, std::size_t total, bool owner, ShmIdentity identity)
      : name_(std::move(name)), base_(base), total_(total), owner_(owner), identity_(identity) {}

  std::string name_;
  void *base_;
  std::size_t total_;
  bool owner_;
  ShmIdentity identity_;
};

// ---------------------------------------------------------------------------
// TensorSpec / TransferHandle
// ---------------------------------------------------------------------------

std::size_t TensorSpec::ElementSize() const {
  if (dtype == "uint8" || dtype == "int8" || dtype == "bool") return 1;
  if (dtype == "float16" || dtype == "bfloat16" || dtype == "int16") return 2;
  if (dtype == "float32" || dtype == "int32") return 4;
  if (dtype == "float64" || dtype == "int64") return 8;
  throw TransferError("unsupported dtype '" + dtype + "'");
}

std::size_t TensorSpec::NumElements() const {
  std::size_t n = 1;
  for (int64_t dim : shape) {
    if (dim < 0) throw TransferError("negative dimension in tensor shape");
    n *= static_cast<std::size_t>(dim);
  }
  return n;
}

const char *TransferStateName(TransferState state) {
  switch (state) {
  case TransferState::kIdle:
    return "idle";
  case TransferState::kCreated:
    return "created";
  case TransferState::kInProgress:
    return "in_progress";
  case TransferState::kCompleted:
    return "completed";
  case TransferState::kFailed:
    return "failed";
  }
  return "unknown";
}

std::string TransferHandle::Serialize() const {
  json j = {{"v", kHandleVersion},
            {"ns", ns},
            {"segment", segment},
            {"generation", generation},
            {"size", size},
            {"kind", KindName(kind)},
            {"spec", {{"shape", spec.shape}, {"dtype", spec.dtype}, {"device", spec.device}}}};
  return j.dump();
}

TransferHandle TransferHandle::Parse(const std::string &serialized) {
  json j = json::parse(serialized, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    throw TransferError("transfer handle is not a JSON object");
  }
  try {
    if (j.at("v").get<int>() != kHandleVersion) {
      throw TransferError("unsupported transfer handle version");
    }
    TransferHandle h;
    h.ns = j.at("ns").get<std::string>();
    h.segment = j.at("segment").get<std::string>();
    h.generation = j.at("generation").get<uint64_t>();
    h.size = j.at("size").get<uint64_t>();
    h.kind = ParseKind(j.at("kind").get<std::string>());
    const auto &spec = j.at("spec");
    h.spec.shape = spec.at("shape").get<std::vector<int64_t>>();
    h.spec.dtype = spec.at("dtype").get<std::string>();
    h.spec.device = spec.at("device").get<std::string>();
    return h;
  } catch (const json::exception &e) {
    throw TransferError(std::string("malformed transfer handle: ") + e.what());
  }
}

// ---------------------------------------------------------------------------
// Descriptor
// ---------------------------------------------------------------------------

Descriptor::Descriptor(TransferSession *session, TransferBuffer buffer)
    : session_(session), spec_(std::move(buffer.spec)), size_(spec_.Bytes()),
      heap_(std::move(buffer.bytes)) {
  if (heap_.size() > size_) {
    throw TransferError("buffer larger than its tensor spec");
  }
  heap_.resize(size_, 0);
}

Descriptor::~Descriptor() = default;

bool Descriptor::IsRegistered() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return segment_ != nullptr;
}

const std::string &Descriptor::SegmentName() const {
  static const std::string kEmpty;
  std::lock_guard<std::mutex> lock(mutex_);
  return segment_ ? segment_->Name() : kEmpty;
}

const uint8_t *Descriptor::Data() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return segment_ ? segment_->Payload() : heap_.data();
}

uint8_t *Descriptor::MutableData() {
  std::lock_guard<std::mutex> lock(mutex_);
  return segment_ ? segment_->Payload() : heap_.data();
}

void Descriptor::RegisterMemory() { session_->EnsureRegistered(*this); }

// ---------------------------------------------------------------------------
// TransferOperation
// ---------------------------------------------------------------------------

TransferOperation::TransferOperation(std::shared_ptr<Descriptor> descriptor, OperationKind kind)
    : descriptor_(std::move(descriptor)) {
  {
    std::lock_guard<std::mutex> lock(descriptor_->mutex_);
    segment_ = descriptor_->segment_;
  }
  auto *header = segment_->Header();
  // The descriptor is exclusively ours and idle, so only this thread moves
  // the word until Created is published.
  const uint64_t generation =
      GenerationOf(header->control.load(std::memory_order_acquire)) + 1;
  header->bytes_transferred.store(0, std::memory_order_relaxed);
  header->kind.store(static_cast<uint32_t>(kind), std::memory_order_relaxed);
  header->control.store(Pack(generation, TransferState::kCreated), std::memory_order_release);

  handle_.ns = descriptor_->session_->Namespace();
  handle_.segment = segment_->Name();
  handle_.generation = generation;
  handle_.size = descriptor_->size_;
  handle_.kind = kind;
  handle_.spec = descriptor_->spec_;
}

TransferOperation::~TransferOperation() {
  auto *header = segment_->Header();
  const auto deadline = std::chrono::steady_clock::now() + kInProgressGrace;
  auto backoff = std::chrono::microseconds(50);
  uint64_t word = header->control.load(std::memory_order_acquire);
  while (true) {
    if (StateOf(word) == TransferState::kInProgress) {
      // A peer is copying; let it finish before anyone can reuse the region.
      if (std::chrono::steady_clock::now() >= deadline) {
        log::Error("transfer", "peer operation never finished, quarantining descriptor",
                   "segment=" + handle_.segment +
                       " generation=" + std::to_string(handle_.generation));
        descriptor_->quarantined_.store(true, std::memory_order_release);
        return;
      }
      std::this_thread::sleep_for(backoff);
      backoff = std::min(backoff * 2, std::chrono::microseconds(1000));
      word = header->control.load(std::memory_order_acquire);
      continue;
    }
    // Revoke and go idle in one step: a late peer now fails its CAS.
    if (header->control.compare_exchange_weak(
            word, Pack(GenerationOf(word) + 1, TransferState::kIdle), std::memory_order_acq_rel,
            std::memory_order_acquire)) {
      break;
    }
  }
  header->kind.store(static_cast<uint32_t>(OperationKind::kNone), std::memory_order_relaxed);
  descriptor_->in_use_.store(false, std::memory_order_release);
}

std::string TransferOperation::Serialize() const { return handle_.Serialize(); }

TransferState TransferOperation::State() const {
  return StateOf(segment_->Header()->control.load(std::memory_order_acquire));
}

uint64_t TransferOperation::BytesTransferred() const {
  return segment_->Header()->bytes_transferred.load(std::memory_order_acquire);
}

bool TransferOperation::WaitForCompletion(std::chrono::milliseconds ceiling) {
  if (completed_) return true;
  const auto deadline = std::chrono::steady_clock::now() + ceiling;
  auto backoff = std::chrono::microseconds(50);
  const auto max_backoff = std::chrono::microseconds(1000);
  while (true) {
    const TransferState state = State();
    if (state == TransferState::kCompleted) {
      completed_ = true;
      return true;
    }
    if (state == TransferState::kFailed) {
      throw TransferError("transfer on " + handle_.segment + " failed on the remote side");
    }
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) return false;
    std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(backoff, deadline - now));
    backoff = std::min(backoff * 2, max_backoff);
  }
}

// ---------------------------------------------------------------------------
// TransferSession
// ---------------------------------------------------------------------------

TransferSession::TransferSession(std::string ns) : ns_(std::move(ns)) {}

TransferSession::~TransferSession() = default;

void TransferSession::Initialize() {
  bool expected = false;
  if (!initialized_.compare_exchange_strong(expected, true)) return;
  log::Info("transfer", "session initialized", "namespace=" + ns_);
}

std::string TransferSession::NextSegmentName() {
  std::ostringstream oss;
  oss << "/pdserve_" << SanitizeNamespace(ns_) << "_" << ::getpid() << "_"
      << g_segment_seq.fetch_add(1, std::memory_order_relaxed);
  return oss.str();
}

std::shared_ptr<Descriptor> TransferSession::Register(TransferBuffer buffer,
                                                      RegistrationMode mode) {
  if (!Initialized()) {
    throw TransferError("transfer session '" + ns_ + "' used before Initialize()");
  }
  std::shared_ptr<Descriptor> descriptor(new Descriptor(this, std::move(buffer)));
  if (mode == RegistrationMode::kEager) EnsureRegistered(*descriptor);
  return descriptor;
}

void TransferSession::EnsureRegistered(Descriptor &descriptor) {
  std::lock_guard<std::mutex> dlock(descriptor.mutex_);
  if (descriptor.segment_) return;
  auto segment = ShmSegment::Create(NextSegmentName(), descriptor.size_);
  if (!descriptor.heap_.empty()) {
    std::memcpy(segment->Payload(), descriptor.heap_.data(), descriptor.size_);
  }
  descriptor.heap_.clear();
  descriptor.heap_.shrink_to_fit();
  descriptor.segment_ = segment;
  std::lock_guard<std::mutex> lock(mutex_);
  owned_segments_[segment->Name()] = segment;
  ++registered_;
}

std::unique_ptr<WritableOperation>
TransferSession::CreateWritable(std::shared_ptr<Descriptor> descriptor) {
  EnsureRegistered(*descriptor);
  if (descriptor->Quarantined()) {
    throw TransferError("descriptor " + descriptor->SegmentName() + " is quarantined");
  }
  bool expected = false;
  if (!descriptor->in_use_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
    throw TransferError("descriptor " + descriptor->SegmentName() +
                        " already has an outstanding operation");
  }
  return std::unique_ptr<WritableOperation>(new WritableOperation(std::move(descriptor)));
}

std::unique_ptr<ReadableOperation>
TransferSession::CreateReadable(std::shared_ptr<Descriptor> descriptor) {
  EnsureRegistered(*descriptor);
  if (descriptor->Quarantined()) {
    throw TransferError("descriptor " + descriptor->SegmentName() + " is quarantined");
  }
  bool expected = false;
  if (!descriptor->in_use_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
    throw TransferError("descriptor " + descriptor->SegmentName() +
                        " already has an outstanding operation");
  }
  return std::unique_ptr<ReadableOperation>(new ReadableOperation(std::move(descriptor)));
}

std::shared_ptr<ShmSegment> TransferSession::OpenPeerSegment(const TransferHandle &handle) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto owned = owned_segments_.find(handle.segment);
  if (owned != owned_segments_.end()) {
    if (auto segment = owned->second.lock()) return segment;
    owned_segments_.erase(owned);
  }
  ShmIdentity current;
  const bool exists = ShmSegment::Stat(handle.segment, &current);
  auto peer = peer_segments_.find(handle.segment);
  if (peer != peer_segments_.end()) {
    if (exists && peer->second->Identity() == current) return peer->second;
    // The owner went away, or a restarted owner reused the name.
    peer_segments_.erase(peer);
  }
  if (!exists) {
    throw TransferError("segment " + handle.segment + " no longer exists");
  }
  SweepPeerSegments();
  auto segment = ShmSegment::Open(handle.segment);
  peer_segments_.emplace(handle.segment, segment);
  return segment;
}

void TransferSession::SweepPeerSegments() {
  for (auto it = peer_segments_.begin(); it != peer_segments_.end();) {
    ShmIdentity current;
    if (ShmSegment::Stat(it->first, &current) && it->second->Identity() == current) {
      ++it;
    } else {
      log::Debug("transfer", "dropping mapping of a departed peer segment",
                 "segment=" + it->first);
      it = peer_segments_.erase(it);
    }
  }
}

std::size_t TransferSession::PeerMappingCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peer_segments_.size();
}

namespace {

// Claims the operation for this peer: Created -> InProgress, but only for
// the generation named in the handle.
void BeginPeerOperation(SegmentHeader *header, const TransferHandle &handle,
                        OperationKind kind) {
  if (handle.kind != kind) {
    throw TransferError(std::string("handle is for a ") + KindName(handle.kind) +
                        " operation, not " + KindName(kind));
  }
  uint64_t expected = Pack(handle.generation, TransferState::kCreated);
  if (!header->control.compare_exchange_strong(
          expected, Pack(handle.generation, TransferState::kInProgress),
          std::memory_order_acq_rel, std::memory_order_acquire)) {
    if (GenerationOf(expected) != handle.generation) {
      throw TransferError("stale transfer handle for " + handle.segment);
    }
    throw TransferError(std::string("operation on ") + handle.segment + " is " +
                        TransferStateName(StateOf(expected)));
  }
}

// InProgress -> `outcome` for the handle's generation.  The owner never
// revokes an in-progress operation, so this only fails if the header was
// changed outside this protocol.
void FinishPeerOperation(SegmentHeader *header, const TransferHandle &handle,
                         TransferState outcome) {
  uint64_t expected = Pack(handle.generation, TransferState::kInProgress);
  if (!header->control.compare_exchange_strong(expected, Pack(handle.generation, outcome),
                                               std::memory_order_acq_rel,
                                               std::memory_order_acquire)) {
    throw TransferError("transfer on " + handle.segment + " was revoked while in progress");
  }
}

}  // namespace

void TransferSession::Write(const std::string &serialized_handle, const void *data,
                            std::size_t size, std::size_t offset) {
  const TransferHandle handle = TransferHandle::Parse(serialized_handle);
  auto segment = OpenPeerSegment(handle);
  auto *header = segment->Header();
  BeginPeerOperation(header, handle, OperationKind::kWrite);
  if (offset > header->payload_size || size > header->payload_size - offset) {
    FinishPeerOperation(header, handle, TransferState::kFailed);
    throw TransferError("write of " + std::to_string(size) + " bytes at offset " +
                        std::to_string(offset) + " overflows " + handle.segment + " (" +
                        std::to_string(header->payload_size) + " bytes)");
  }
  if (size > 0) std::memcpy(segment->Payload() + offset, data, size);
  header->bytes_transferred.store(size, std::memory_order_relaxed);
  FinishPeerOperation(header, handle, TransferState::kCompleted);
}

void TransferSession::Read(const std::string &serialized_handle, std::vector<uint8_t> *out) {
  const TransferHandle handle = TransferHandle::Parse(serialized_handle);
  auto segment = OpenPeerSegment(handle);
  auto *header = segment->Header();
  BeginPeerOperation(header, handle, OperationKind::kRead);
  const std::size_t size = static_cast<std::size_t>(header->payload_size);
  out->assign(segment->Payload(), segment->Payload() + size);
  header->bytes_transferred.store(size, std::memory_order_relaxed);
  FinishPeerOperation(header, handle, TransferState::kCompleted);
}

std::size_t TransferSession::RegisteredCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return registered_;
}

// ---------------------------------------------------------------------------
// DescriptorPool
// ---------------------------------------------------------------------------

DescriptorPool::Lease &DescriptorPool::Lease::operator=(Lease &&other) noexcept {
  if (this != &other) {
    Reset();
    pool_ = other.pool_;
    descriptor_ = std::move(other.descriptor_);
    other.pool_ = nullptr;
  }
  return *this;
}

void DescriptorPool::Lease::Reset() {
  if (pool_ && descriptor_) pool_->Release(std::move(descriptor_));
  pool_ = nullptr;
  descriptor_.reset();
}

DescriptorPool::DescriptorPool(TransferSession &session, std::size_t count,
                               const TensorSpec &spec, RegistrationMode mode)
    : session_(session), spec_(spec), mode_(mode), capacity_(count) {
  free_.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    free_.push_back(session.Register(TransferBuffer{spec, {}}, mode));
  }
}

DescriptorPool::Lease DescriptorPool::Acquire(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!cv_.wait_for(lock, timeout, [this] { return !free_.empty(); })) {
    return Lease();
  }
  auto descriptor = std::move(free_.back());
  free_.pop_back();
  return Lease(this, std::move(descriptor));
}

void DescriptorPool::Release(std::shared_ptr<Descriptor> descriptor) {
  if (descriptor->Quarantined()) {
    try {
      descriptor = session_.Register(TransferBuffer{spec_, {}}, mode_);
      log::Warn("transfer", "replaced a quarantined descriptor",
                "segment=" + descriptor->SegmentName());
    } catch (const std::exception &e) {
      log::Error("transfer", "could not replace a quarantined descriptor, pool shrinks",
                 std::string("error=") + e.what());
      std::lock_guard<std::mutex> lock(mutex_);
      --capacity_;
      return;
    }
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    free_.push_back(std::move(descriptor));
  }
  cv_.notify_one();
}

std::size_t DescriptorPool::Available() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return free_.size();
}

}  // namespace disaggregated
}  // namespace pdserve
