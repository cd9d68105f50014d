#pragma once
#include "gitrelay/remote_store.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace gitrelay {

class LocalRepository;
class Logger;
class TransferPool;

namespace closure {

/**
 * Ids of the objects the remote needs so that everything reachable from
 * `root` is stored there.
 *
 * Walks the local database depth-first from `root` and prunes every id in
 * `present`: an object the remote already holds implies it holds everything
 * that object reaches. Each id appears once, in depth-first discovery order.
 * Object bytes are not retained. Throws IntegrityError if a local object
 * does not hash to its id.
 */
std::vector<std::string> objects_to_upload(const LocalRepository& local, std::string_view root,
                               const std::unordered_set<std::string>& present);

// Loose bytes of a local object, checked against its id (IntegrityError).
std::vector<std::uint8_t> read_verified(const LocalRepository& local, std::string_view hex_oid);

/**
 * Download `roots` and everything they reference from the remote into the
 * local database. Every object is verified against the id it was requested
 * under before it is written locally; a mismatch throws IntegrityError.
 * `seen` is shared closure membership (ids in it are not fetched again).
 */
void fetch_all(const RemoteStore& store, const LocalRepository& local, const TransferPool& pool,
               const std::vector<std::string>& roots, std::unordered_set<std::string>& seen,
               Logger& log);

} // namespace closure

} // namespace gitrelay
