#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace pdserve {
namespace disaggregated {

// Shape/dtype/device of a registered region.  Only recorded and carried in
// handles; the transport itself moves bytes.
struct TensorSpec {
  std::vector<int64_t> shape;
  std::string dtype{"uint8"};
  std::string device{"cpu"};

  std::size_t ElementSize() const;
  std::size_t NumElements() const;
  std::size_t Bytes() const { return ElementSize() * NumElements(); }
};

// Caller-provided memory to be registered.  `bytes` may be empty, in which
// case the region is zero-filled to spec.Bytes().
struct TransferBuffer {
  TensorSpec spec;
  std::vector<uint8_t> bytes;
};

enum class RegistrationMode {
  kEager,  // create the shared segment inside Register()
  kLazy,   // defer until the first operation on the descriptor
};

// Operation lifecycle as stored in the shared segment header.  kIdle means
// no operation currently owns the descriptor.
enum class TransferState : uint32_t {
  kIdle = 0,
  kCreated = 1,
  kInProgress = 2,
  kCompleted = 3,
  kFailed = 4,
};

const char *TransferStateName(TransferState state);

enum class OperationKind : uint32_t { kNone = 0, kWrite = 1, kRead = 2 };

// Decoded form of the opaque handle produced by Serialize().
struct TransferHandle {
  std::string ns;
  std::string segment;
  uint64_t generation{0};
  uint64_t size{0};
  OperationKind kind{OperationKind::kNone};
  TensorSpec spec;

  std::string Serialize() const;
  // Throws TransferError on malformed input.
  static TransferHandle Parse(const std::string &serialized);
};

class ShmSegment;
class TransferSession;

// A registered memory region.  Long-lived and reused sequentially: at most
// one operation (read or write) may be outstanding at a time.
class Descriptor {
 public:
  ~Descriptor();
  Descriptor(const Descriptor &) = delete;
  Descriptor &operator=(const Descriptor &) = delete;

  const TensorSpec &Spec() const { return spec_; }
  std::size_t Size() const { return size_; }
  bool IsRegistered() const;
  const std::string &SegmentName() const;

  // Region contents.  The pointer changes once, when lazy registration moves
  // the bytes into shared memory; do not cache it across operations.
  const uint8_t *Data() const;
  uint8_t *MutableData();

  // Registers now if registration was deferred.
  void RegisterMemory();

  bool Busy() const { return in_use_.load(std::memory_order_acquire); }
  // Set when a peer never finished an operation; the region is never
  // handed out again.
  bool Quarantined() const { return quarantined_.load(std::memory_order_acquire); }

 private:
  friend class TransferSession;
  friend class TransferOperation;
  Descriptor(TransferSession *session, TransferBuffer buffer);

  TransferSession *session_;
  TensorSpec spec_;
  std::size_t size_;
  mutable std::mutex mutex_;
  std::vector<uint8_t> heap_;
  std::shared_ptr<ShmSegment> segment_;
  std::atomic<bool> in_use_{false};
  std::atomic<bool> quarantined_{false};
};

// Grants a remote peer access to a descriptor for the lifetime of this
// object.  Destruction revokes the handle (generation bump) and frees the
// descriptor for the next operation, including on error paths.  A peer that
// is mid-copy at that point is waited for; one that never finishes leaves
// the descriptor quarantined.
class TransferOperation {
 public:
  virtual ~TransferOperation();
  TransferOperation(const TransferOperation &) = delete;
  TransferOperation &operator=(const TransferOperation &) = delete;

  // Opaque handle the remote peer passes to TransferSession::Write/Read.
  std::string Serialize() const;
  const TransferHandle &Handle() const { return handle_; }
  TransferState State() const;

  // Returns true once the remote side finished, false if `ceiling` elapsed
  // first.  Throws TransferError if the remote side failed.  A call after
  // completion returns immediately.
  bool WaitForCompletion(std::chrono::milliseconds ceiling);

  uint64_t BytesTransferred() const;

 protected:
  TransferOperation(std::shared_ptr<Descriptor> descriptor, OperationKind kind);

 private:
  std::shared_ptr<Descriptor> descriptor_;
  std::shared_ptr<ShmSegment> segment_;
  TransferHandle handle_;
  bool completed_{false};
};

class WritableOperation : public TransferOperation {
 private:
  friend class TransferSession;
  explicit WritableOperation(std::shared_ptr<Descriptor> descriptor)
      : TransferOperation(std::move(descriptor), OperationKind::kWrite) {}
};

class ReadableOperation : public TransferOperation {
 private:
  friend class TransferSession;
  explicit ReadableOperation(std::shared_ptr<Descriptor> descriptor)
      : TransferOperation(std::move(descriptor), OperationKind::kRead) {}
};

// Zero-copy memory transfer over POSIX shared memory.
//
// Owner side: Register() a buffer, CreateWritable()/CreateReadable() per
// request, hand Serialize() to the peer, WaitForCompletion().
// Peer side: Write()/Read() with the serialized handle.  Peers map the
// owner's segment directly, so bytes are copied exactly once.
//
// Segment names embed the namespace and the owning pid:
//   /pdserve_<namespace>_<pid>_<seq>
class TransferSession {
 public:
  explicit TransferSession(std::string ns);
  ~TransferSession();
  TransferSession(const TransferSession &) = delete;
  TransferSession &operator=(const TransferSession &) = delete;

  // Must be called once before Register().
  void Initialize();
  bool Initialized() const { return initialized_.load(std::memory_order_acquire); }
  const std::string &Namespace() const { return ns_; }

  std::shared_ptr<Descriptor> Register(TransferBuffer buffer,
                                       RegistrationMode mode = RegistrationMode::kLazy);

  // Throws TransferError if another operation already owns the descriptor.
  std::unique_ptr<WritableOperation> CreateWritable(std::shared_ptr<Descriptor> descriptor);
  std::unique_ptr<ReadableOperation> CreateReadable(std::shared_ptr<Descriptor> descriptor);

  // Peer side.  Copies `size` bytes into the region at `offset` and marks the
  // operation completed.  Throws TransferError on stale handles, kind
  // mismatch, a second writer, or overflow (the latter marks it failed).
  void Write(const std::string &serialized_handle, const void *data, std::size_t size,
             std::size_t offset = 0);
  void Read(const std::string &serialized_handle, std::vector<uint8_t> *out);

  std::size_t RegisteredCount() const;
  // Peer segments currently mapped by Write()/Read().  Mappings of owners
  // that went away are dropped when the next new segment is opened.
  std::size_t PeerMappingCount() const;

 private:
  friend class Descriptor;
  void EnsureRegistered(Descriptor &descriptor);
  std::string NextSegmentName();
  std::shared_ptr<ShmSegment> OpenPeerSegment(const TransferHandle &handle);
  // Requires mutex_.
  void SweepPeerSegments();

  std::string ns_;
  std::atomic<bool> initialized_{false};
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::weak_ptr<ShmSegment>> owned_segments_;
  std::unordered_map<std::string, std::shared_ptr<ShmSegment>> peer_segments_;
  std::size_t registered_{0};
};

// Fixed set of long-lived descriptors handed out one request at a time.
class DescriptorPool {
 public:
  class Lease {
   public:
    Lease() = default;
    Lease(DescriptorPool *pool, std::shared_ptr<Descriptor> descriptor)
        : pool_(pool), descriptor_(std::move(descriptor)) {}
    ~Lease() { Reset(); }
    Lease(Lease &&other) noexcept
        : pool_(other.pool_), descriptor_(std::move(other.descriptor_)) {
      other.pool_ = nullptr;
    }
    Lease &operator=(Lease &&other) noexcept;
    Lease(const Lease &) = delete;
    Lease &operator=(const Lease &) = delete;

    explicit operator bool() const { return descriptor_ != nullptr; }
    const std::shared_ptr<Descriptor> &Get() const { return descriptor_; }
    void Reset();

   private:
    DescriptorPool *pool_{nullptr};
    std::shared_ptr<Descriptor> descriptor_;
  };

  DescriptorPool(TransferSession &session, std::size_t count, const TensorSpec &spec,
                 RegistrationMode mode);

  // Blocks up to `timeout`; an empty lease means none became free.
  Lease Acquire(std::chrono::milliseconds timeout);
  std::size_t Available() const;
  std::size_t Capacity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return capacity_;
  }

 private:
  void Release(std::shared_ptr<Descriptor> descriptor);

  TransferSession &session_;
  TensorSpec spec_;
  RegistrationMode mode_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<std::shared_ptr<Descriptor>> free_;
  std::size_t capacity_;
};

}  // namespace disaggregated
}  // namespace pdserve
