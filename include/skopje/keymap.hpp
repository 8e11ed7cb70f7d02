#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

#include <boost/bimap.hpp>
#include <boost/bimap/unordered_set_of.hpp>

#include "skopje/db/connection.hpp"
#include "skopje/db/result.hpp"
#include "skopje/db/statement.hpp"
#include "skopje/db/transaction.hpp"
#include "skopje/db/types.hpp"
#include "skopje/error.hpp"
#include "skopje/logging.hpp"

namespace skopje {

/**
 * Bijective surrogate key allocator.
 *
 * Maps business objects to dense non-negative integer keys. next_key() is
 * always the smallest non-negative key not in use, so keys freed in the
 * backing table are reused before the key space grows. Every key up to and
 * including the largest PK value can be allocated; once all of them are in
 * use the map is exhausted() and next_key() throws.
 *
 * Not synchronized: callers sharing a KeyMap across threads must lock around it.
 */
template <typename PK, typename Obj>
class KeyMap {
    static_assert(std::is_integral_v<PK> && !std::is_same_v<PK, bool>,
                  "KeyMap keys must be integers");

public:
    using bimap_type = boost::bimap<boost::bimaps::unordered_set_of<PK>,
                                    boost::bimaps::unordered_set_of<Obj>>;

    KeyMap() = default;

    // Wrap an existing bijection; next_key() is recomputed from it.
    explicit KeyMap(bimap_type map)
        : map_(std::move(map)), next_key_(lowest_free_from(map_, PK{0})) {}

    /**
     * Key of obj, allocating next_key() for it when it has none.
     * Throws InvalidArgumentError when the key space is exhausted.
     */
    PK transact(const Obj& obj) {
        auto found = map_.right.find(obj);
        if (found != map_.right.end()) {
            return found->second;
        }

        if (!next_key_) {
            throw InvalidArgumentError("key space exhausted", "KeyMap::transact");
        }
        const PK key = *next_key_;
        std::optional<PK> next;
        if (key != std::numeric_limits<PK>::max()) {
            next = lowest_free_from(map_, static_cast<PK>(key + 1));
        }

        map_.insert(typename bimap_type::value_type(key, obj));
        next_key_ = next;
        return key;
    }

    // Throws InvalidArgumentError once every key is in use.
    PK next_key() const {
        if (!next_key_) {
            throw InvalidArgumentError("key space exhausted", "KeyMap::next_key");
        }
        return *next_key_;
    }

    bool exhausted() const { return !next_key_; }

    // Smallest non-negative key absent from map.
    static PK calc_lowest_key(const bimap_type& map) {
        auto key = lowest_free_from(map, PK{0});
        if (!key) {
            throw InvalidArgumentError("key space exhausted", "KeyMap::calc_lowest_key");
        }
        return *key;
    }

    size_t size() const { return map_.size(); }
    bool empty() const { return map_.empty(); }

    std::optional<PK> find_key(const Obj& obj) const {
        auto it = map_.right.find(obj);
        if (it == map_.right.end()) return std::nullopt;
        return it->second;
    }

    std::optional<Obj> find_object(PK key) const {
        auto it = map_.left.find(key);
        if (it == map_.left.end()) return std::nullopt;
        return it->second;
    }

    const bimap_type& bimap() const { return map_; }

    bool operator==(const KeyMap& other) const {
        if (map_.size() != other.map_.size() || next_key_ != other.next_key_) {
            return false;
        }
        for (const auto& entry : map_) {
            auto it = other.map_.left.find(entry.left);
            if (it == other.map_.left.end() || !(it->second == entry.right)) {
                return false;
            }
        }
        return true;
    }
    bool operator!=(const KeyMap& other) const { return !(*this == other); }

    /**
     * Load a KeyMap from a query projecting exactly (key, object).
     * Throws SchemaMismatchError on any other column count, on undecodable
     * cells, or when the rows are not a bijection.
     */
    static KeyMap pg_fetch(db::ConnectionPool& pool, const std::string& select_statement) {
        auto conn = pool.acquire();
        db::Result res = db::exec(conn.get(), select_statement);

        if (res.columns() != 2) {
            throw SchemaMismatchError("key map query must return 2 columns, got " +
                                      std::to_string(res.columns()), select_statement);
        }

        bimap_type map;
        for (int row = 0; row < res.rows(); ++row) {
            PK key = res.get<PK>(row, 0);
            Obj obj = res.get<Obj>(row, 1);
            if (!map.insert(typename bimap_type::value_type(key, std::move(obj))).second) {
                throw SchemaMismatchError("duplicate key or object in row " + std::to_string(row),
                                          select_statement);
            }
        }

        KeyMap result(std::move(map));
        LOG_DEBUG("Loaded key map: " + std::to_string(result.size()) + " entries, next key " +
                  (result.exhausted() ? std::string("none") : std::to_string(result.next_key())));
        return result;
    }

    /**
     * Write every (key, object) pair with insert_statement ($1 = key, $2 = object)
     * in one transaction. Nothing is committed unless every row succeeds.
     */
    void pg_persist(db::ConnectionPool& pool, const std::string& insert_statement) const {
        auto conn = pool.acquire();
        try {
            db::PreparedStatement prepared(conn.get(), insert_statement);
            db::Transaction tx(conn.get());
            for (const auto& entry : map_) {
                prepared.execute(db::Row{db::Value(entry.left), db::Value(entry.right)});
            }
            tx.commit();
        } catch (const SkopjeException& e) {
            LOG_ERROR("Persisting key map failed: " + e.message());
            throw;
        }
        LOG_DEBUG("Persisted key map: " + std::to_string(map_.size()) + " entries");
    }

private:
    // nullopt when every key from start to the largest PK value is taken
    static std::optional<PK> lowest_free_from(const bimap_type& map, PK start) {
        PK key = start;
        while (map.left.find(key) != map.left.end()) {
            if (key == std::numeric_limits<PK>::max()) {
                return std::nullopt;
            }
            ++key;
        }
        return key;
    }

    bimap_type map_;
    std::optional<PK> next_key_ = PK{0};
};

} // namespace skopje
