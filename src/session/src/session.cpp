#include "l2db/session/session.h"
#include "l2db/format/l2db-errors.h"
#include "l2db/format/l2db-header.h"
#include "l2db/format/l2db-value-convert.h"
#include "l2db/storage/file-storage.h"
#include "l2db/storage/memory-storage.h"
#include <algorithm>
#include <limits>
#include <set>

namespace l2db {

LogPartition Session::log_partition_("session");

namespace {

HeaderBytes
fresh_header(const SessionOptions& options)
{
    Header header;
    header.flags = options.flags & static_cast<uint8_t>(~FLAG_DIRTY);
    return encode_header(header);
}

// A live entry planned during cleanup, with where its bytes end up
struct PlannedEntry
{
    IndexEntry entry;
    std::optional<Bytes> payload;  // appended after compaction when set
    uint64_t new_start = 0;
    uint64_t new_end = 0;
    bool placed = false;
};

// Replacement bytes for a payload that failed to decode, or nullopt when
// the entry is kept as it is under a new tag
std::optional<Bytes>
repair_payload(IndexEntry& entry, const DecodedValue& decoded)
{
    switch (entry.tag)
    {
        case TypeTag::BOL:
            return Bytes{0x01};
        case TypeTag::NUL:
            return Bytes{0x00};
        case TypeTag::INT:
            return encode_int(std::get<int64_t>(decoded.value));
        case TypeTag::UIN:
            return encode_uint(std::get<uint64_t>(decoded.value));
        default:
            entry.tag = TypeTag::RAW;
            return std::nullopt;
    }
}

}  // namespace

Session::Session(
    std::unique_ptr<StorageBackend> backend,
    const SessionOptions& options)
    : backend_(std::move(backend)), options_(options)
{
    open();
}

Session::~Session()
{
    try
    {
        close();
    }
    catch (const std::exception& e)
    {
        LOGE("Error closing l2db session: ", e.what());
    }
}

std::unique_ptr<Session>
Session::from_map(const ValueMap& values, const SessionOptions& options)
{
    auto backend = std::make_unique<MemoryStorage>(
        fresh_header(options), Bytes{}, Bytes{});
    auto session = std::make_unique<Session>(std::move(backend), options);

    session->bootstrapping_ = true;
    for (const auto& [key, value] : values)
    {
        session->write(key, value);
    }
    session->bootstrapping_ = false;
    session->modified_ = false;
    return session;
}

std::unique_ptr<Session>
Session::from_bytes(const Bytes& bytes, const SessionOptions& options)
{
    return std::make_unique<Session>(
        MemoryStorage::from_image(Slice(bytes)), options);
}

std::unique_ptr<Session>
Session::for_file(
    const boost::filesystem::path& path,
    const SessionOptions& options)
{
    bool writable = has_mode(options.mode, OpenMode::WRITE);
    bool unbuffered = has_mode(options.mode, OpenMode::UNBUFFERED);

    bool exists = false;
    try
    {
        exists = boost::filesystem::exists(path);
    }
    catch (const boost::filesystem::filesystem_error& e)
    {
        throw L2dbIOError("Filesystem error: " + std::string(e.what()));
    }

    std::unique_ptr<StorageBackend> backend;
    if (!exists)
    {
        if (!writable || !options.create_if_missing)
        {
            throw L2dbIOError("File does not exist: " + path.string());
        }

        LOGI("Creating new database ", path.string());
        if (unbuffered)
        {
            backend = FileStorage::create(path, fresh_header(options));
        }
        else
        {
            auto memory = std::make_unique<MemoryStorage>(
                fresh_header(options), Bytes{}, Bytes{}, path);
            memory->sync();
            backend = std::move(memory);
        }
    }
    else if (unbuffered)
    {
        backend = std::make_unique<FileStorage>(path, writable);
    }
    else
    {
        Bytes contents = load_file(path);
        backend = MemoryStorage::from_image(Slice(contents), path);
    }

    return std::make_unique<Session>(std::move(backend), options);
}

std::unique_ptr<Session>
Session::for_stream(std::iostream& stream, const SessionOptions& options)
{
    stream.clear();
    stream.seekg(0, std::ios::end);
    std::streamoff end = stream.tellg();
    if (!stream || end < 0)
    {
        throw L2dbIOError("Stream is not seekable");
    }

    if (end == 0 && has_mode(options.mode, OpenMode::WRITE) &&
        options.create_if_missing)
    {
        HeaderBytes header = fresh_header(options);
        stream.seekp(0, std::ios::beg);
        stream.write(
            reinterpret_cast<const char*>(header.data()),
            static_cast<std::streamsize>(header.size()));
        stream.flush();
        if (!stream)
        {
            throw L2dbIOError("Failed to initialize stream");
        }
    }

    return std::make_unique<Session>(
        std::make_unique<FileStorage>(stream), options);
}

void
Session::open()
{
    HeaderBytes raw = backend_->read_header();
    header_ = decode_header(Slice(raw.data(), raw.size()), options_.strict);
    state_ = header_.dirty() ? SessionState::DIRTY : SessionState::CLEAN;

    uint64_t available = backend_->index_size();
    if (header_.index_len != available)
    {
        std::string reason = "index length " +
            std::to_string(header_.index_len) + " exceeds the " +
            std::to_string(available) + " bytes available";
        if (options_.strict)
        {
            throw L2dbSyntaxError("Malformed database: " + reason);
        }
        header_.index_len = static_cast<uint32_t>(available);
        mark_dirty(reason);
    }

    IndexScan scan = load_index().scan();
    if (!scan.ok())
    {
        mark_dirty("malformed index: " + scan.anomaly);
    }

    uint64_t value_size = backend_->value_size();
    for (const auto& location : scan.entries)
    {
        if (!in_bounds(location.entry, value_size))
        {
            mark_dirty(
                "entry '" + location.entry.key +
                "' points outside the value block");
            break;
        }
    }

    OLOGI(
        "Opened ",
        backend_->describe(),
        " mode=",
        to_string(options_.mode),
        " entries=",
        scan.entries.size(),
        dirty() ? " (dirty)" : "");
}

void
Session::check_open() const
{
    if (state_ == SessionState::CLOSED)
    {
        throw L2dbClosedError("Session is closed");
    }
}

void
Session::require_readable() const
{
    check_open();
    if (!has_mode(options_.mode, OpenMode::READ))
    {
        throw L2dbWriteOnlyError("Database was not opened for reading");
    }
}

void
Session::require_writable() const
{
    check_open();
    if (!bootstrapping_ && !has_mode(options_.mode, OpenMode::WRITE))
    {
        throw L2dbReadOnlyError("Database was not opened for writing");
    }
}

void
Session::require_clean() const
{
    if (state_ == SessionState::DIRTY)
    {
        throw L2dbDirtyDatabaseError(
            "Database is dirty; run cleanup before modifying it");
    }
}

Index
Session::load_index()
{
    return Index(backend_->read_index(), header_.wide_index());
}

void
Session::store_index(const Index& index)
{
    if (index.size() > std::numeric_limits<uint32_t>::max())
    {
        throw L2dbError("Index block exceeds the 4 GiB header limit");
    }
    backend_->write_index(index.bytes());
    header_.index_len = static_cast<uint32_t>(index.size());
    persist_header();
}

void
Session::persist_header()
{
    backend_->write_header(encode_header(header_));
    modified_ = true;
}

void
Session::mark_dirty(const std::string& reason)
{
    bool was_dirty = header_.dirty();
    state_ = SessionState::DIRTY;
    header_.set_flag(FLAG_DIRTY, true);
    OLOGW("Database marked dirty: ", reason);

    if (!was_dirty &&
        (bootstrapping_ || has_mode(options_.mode, OpenMode::WRITE)))
    {
        persist_header();
        if (!backend_->buffered())
        {
            backend_->sync();
        }
    }
}

DecodedValue
Session::decode_entry(const IndexEntry& entry)
{
    uint64_t value_size = backend_->value_size();
    if (in_bounds(entry, value_size))
    {
        Bytes payload = backend_->read_values(entry.value_start, entry.length());
        return decode_value(entry.tag, Slice(payload));
    }

    uint64_t start = std::min(entry.value_start, value_size);
    uint64_t end = std::clamp(entry.value_end, start, value_size);
    Bytes payload = backend_->read_values(start, end - start);
    DecodedValue decoded = decode_value(entry.tag, Slice(payload));
    decoded.anomaly = true;
    decoded.reason = "range [" + std::to_string(entry.value_start) + ", " +
        std::to_string(entry.value_end) + ") is outside the value block";
    return decoded;
}

Value
Session::read(std::string_view key, std::optional<TypeTag> as_type)
{
    require_readable();

    auto location = load_index().find(key);
    if (!location)
    {
        throw L2dbKeyNotFoundError(std::string(key));
    }

    DecodedValue decoded = decode_entry(location->entry);
    if (decoded.anomaly)
    {
        mark_dirty("key '" + std::string(key) + "': " + decoded.reason);
    }

    if (as_type && *as_type != tag_of(decoded.value))
    {
        return convert_value(decoded.value, *as_type);
    }
    return decoded.value;
}

void
Session::write(
    std::string_view key,
    const Value& value,
    std::optional<TypeTag> as_type)
{
    require_writable();
    if (!bootstrapping_)
    {
        require_clean();
    }
    validate_key(key);

    EncodedValue encoded =
        encode_value(as_type ? convert_value(value, *as_type) : value);
    uint64_t length = encoded.bytes.size();

    Index index = load_index();
    auto location = index.find(key);
    if (location && location->entry.length() >= length &&
        in_bounds(location->entry, backend_->value_size()))
    {
        uint64_t start = location->entry.value_start;
        backend_->write_values(start, Slice(encoded.bytes));
        index.insert_or_update(key, encoded.tag, start, start + length);
        if (length < location->entry.length())
        {
            OLOGD(
                "Shrunk '",
                key,
                "' in place from ",
                location->entry.length(),
                " to ",
                length,
                " bytes");
        }
    }
    else
    {
        uint64_t start = backend_->append_values(Slice(encoded.bytes));
        index.insert_or_update(key, encoded.tag, start, start + length);
        if (location)
        {
            OLOGD(
                "Relocated '",
                key,
                "' from [",
                location->entry.value_start,
                ", ",
                location->entry.value_end,
                ") to [",
                start,
                ", ",
                start + length,
                ")");
        }
        else
        {
            OLOGD("Appended '", key, "' at ", start, " (", length, " bytes)");
        }
    }

    store_index(index);

    if (encoded.anomaly)
    {
        mark_dirty("key '" + std::string(key) + "': NaN has no float encoding");
    }
}

void
Session::remove(std::string_view key)
{
    require_writable();
    require_clean();

    Index index = load_index();
    if (!index.remove(key))
    {
        throw L2dbKeyNotFoundError(std::string(key));
    }
    store_index(index);
    OLOGD("Removed '", key, "'");
}

void
Session::update(const ValueMap& values)
{
    for (const auto& [key, value] : values)
    {
        write(key, value);
    }
}

ValueMap
Session::dump()
{
    require_readable();

    IndexScan scan = load_index().scan();
    if (!scan.ok())
    {
        mark_dirty("malformed index: " + scan.anomaly);
    }

    ValueMap out;
    for (const auto& location : scan.entries)
    {
        if (out.count(location.entry.key))
        {
            continue;
        }
        DecodedValue decoded = decode_entry(location.entry);
        if (decoded.anomaly)
        {
            mark_dirty(
                "key '" + location.entry.key + "': " + decoded.reason);
        }
        out.emplace(location.entry.key, std::move(decoded.value));
    }
    return out;
}

void
Session::flush(
    const std::optional<boost::filesystem::path>& target,
    bool move)
{
    check_open();

    auto own = backend_->location();
    bool to_self = !target || (own && *own == *target);
    if (to_self)
    {
        if (!backend_->has_target())
        {
            throw L2dbIOError("no file specified");
        }
        require_writable();
        backend_->sync();
        modified_ = false;
        OLOGD("Flushed ", backend_->describe());
        return;
    }

    backend_->flush_to(*target);
    OLOGI("Wrote database to ", target->string());
    if (move)
    {
        backend_->retarget(*target);
        modified_ = false;
    }
}

CleanupReport
Session::cleanup(bool only_flag, bool discard_corrupted)
{
    require_writable();
    CleanupReport report;

    if (!only_flag)
    {
        Index index = load_index();
        IndexScan scan = index.scan();
        if (!scan.ok())
        {
            OLOGW(
                "Dropping ",
                index.size() - scan.valid_length,
                " bytes of malformed index: ",
                scan.anomaly);
        }

        uint64_t old_size = backend_->value_size();
        std::vector<PlannedEntry> plan;
        std::set<std::string> seen;
        std::vector<std::pair<uint64_t, uint64_t>> live;

        for (const auto& location : scan.entries)
        {
            IndexEntry entry = location.entry;
            if (!seen.insert(entry.key).second)
            {
                OLOGW("Discarding duplicate entry for '", entry.key, "'");
                ++report.discarded;
                continue;
            }
            if (!in_bounds(entry, old_size))
            {
                OLOGW(
                    "Discarding '",
                    entry.key,
                    "': range outside the value block");
                ++report.discarded;
                continue;
            }

            PlannedEntry planned{entry};
            bool corrupted = false;

            bool overlaps = std::any_of(
                live.begin(), live.end(), [&](const auto& range) {
                    return entry.value_start < range.second &&
                        range.first < entry.value_end;
                });
            Bytes bytes = backend_->read_values(entry.value_start, entry.length());
            if (overlaps)
            {
                corrupted = true;
                planned.payload = bytes;
            }

            DecodedValue decoded = decode_value(entry.tag, Slice(bytes));
            if (decoded.anomaly)
            {
                corrupted = true;
                if (!discard_corrupted)
                {
                    auto repaired = repair_payload(planned.entry, decoded);
                    if (repaired)
                    {
                        planned.payload = std::move(*repaired);
                    }
                }
            }

            if (corrupted)
            {
                if (discard_corrupted)
                {
                    OLOGW("Discarding corrupted entry '", entry.key, "'");
                    ++report.discarded;
                    continue;
                }
                OLOGW(
                    "Repairing '",
                    entry.key,
                    "' as ",
                    tag_code(planned.entry.tag),
                    overlaps ? " (overlapping range)" : "");
                ++report.repaired;
            }

            if (!overlaps)
            {
                live.emplace_back(entry.value_start, entry.value_end);
            }
            plan.push_back(std::move(planned));
        }

        // Slide ranges that keep their bytes down over the dead space. They
        // never overlap, so ascending order only ever moves data backwards.
        std::vector<PlannedEntry*> order;
        for (auto& planned : plan)
        {
            if (!planned.payload)
            {
                order.push_back(&planned);
            }
        }
        std::sort(
            order.begin(), order.end(), [](const auto* a, const auto* b) {
                return a->entry.value_start < b->entry.value_start;
            });

        uint64_t cursor = 0;
        for (auto* planned : order)
        {
            uint64_t length = planned->entry.length();
            backend_->move_values(planned->entry.value_start, cursor, length);
            planned->new_start = cursor;
            planned->new_end = cursor + length;
            planned->placed = true;
            cursor += length;
        }

        backend_->truncate_values(cursor);
        for (auto& planned : plan)
        {
            if (planned.placed)
            {
                continue;
            }
            planned.new_start = backend_->append_values(Slice(*planned.payload));
            planned.new_end = planned.new_start + planned.payload->size();
            planned.placed = true;
        }

        Index rebuilt(Bytes{}, header_.wide_index());
        for (const auto& planned : plan)
        {
            IndexEntry entry = planned.entry;
            entry.value_start = planned.new_start;
            entry.value_end = planned.new_end;
            rebuilt.append(entry);
        }
        store_index(rebuilt);

        report.kept = plan.size();
        uint64_t new_size = backend_->value_size();
        report.reclaimed_bytes = old_size > new_size ? old_size - new_size : 0;
    }

    header_.set_flag(FLAG_DIRTY, false);
    persist_header();
    state_ = SessionState::CLEAN;

    OLOGI(
        "Cleanup finished: kept ",
        report.kept,
        ", repaired ",
        report.repaired,
        ", discarded ",
        report.discarded,
        ", reclaimed ",
        report.reclaimed_bytes,
        " bytes");
    return report;
}

void
Session::close()
{
    if (state_ == SessionState::CLOSED)
    {
        return;
    }

    try
    {
        if (modified_ && options_.flush_on_close &&
            has_mode(options_.mode, OpenMode::WRITE) && backend_->has_target())
        {
            backend_->sync();
            modified_ = false;
        }
    }
    catch (const L2dbError&)
    {
        backend_.reset();
        state_ = SessionState::CLOSED;
        throw;
    }

    OLOGD("Closing ", backend_->describe());
    backend_.reset();
    state_ = SessionState::CLOSED;
}

bool
Session::contains(std::string_view key)
{
    check_open();
    return load_index().find(key).has_value();
}

std::vector<std::string>
Session::keys()
{
    check_open();
    std::vector<std::string> out;
    for (auto& entry : load_index().entries())
    {
        out.push_back(std::move(entry.key));
    }
    return out;
}

size_t
Session::size()
{
    check_open();
    return load_index().scan().entries.size();
}

IndexEntry
Session::entry(std::string_view key)
{
    check_open();
    auto location = load_index().find(key);
    if (!location)
    {
        throw L2dbKeyNotFoundError(std::string(key));
    }
    return location->entry;
}

Bytes
Session::to_bytes()
{
    check_open();
    return backend_->image();
}

SessionStats
Session::stats()
{
    check_open();
    SessionStats stats;
    stats.value_size = backend_->value_size();

    std::vector<std::pair<uint64_t, uint64_t>> ranges;
    for (const auto& entry : load_index().entries())
    {
        ++stats.entry_count;
        if (in_bounds(entry, stats.value_size) && entry.length() > 0)
        {
            ranges.emplace_back(entry.value_start, entry.value_end);
        }
    }

    // Union of the referenced ranges
    std::sort(ranges.begin(), ranges.end());
    uint64_t covered_to = 0;
    for (const auto& [start, end] : ranges)
    {
        uint64_t from = std::max(start, covered_to);
        if (end > from)
        {
            stats.live_bytes += end - from;
            covered_to = end;
        }
    }
    stats.dead_bytes = stats.value_size - stats.live_bytes;
    return stats;
}

void
Session::set_locked(bool locked)
{
    require_writable();
    header_.set_flag(FLAG_LOCKED, locked);
    persist_header();
}

void
Session::widen_index()
{
    require_writable();
    require_clean();
    if (header_.wide_index())
    {
        return;
    }

    Index wide = load_index().rewritten(true);
    header_.set_flag(FLAG_WIDE_INDEX, true);
    store_index(wide);
    OLOGI("Index widened to 8-byte offsets");
}

std::optional<boost::filesystem::path>
Session::location() const
{
    check_open();
    return backend_->location();
}

}  // namespace l2db
