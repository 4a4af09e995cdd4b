/* SPDX-License-Identifier: MPL-2.0 */
/* chring - Cache Shard Selection Example */

#include <chring/chring.h>
#include <iostream>
#include <string>
#include <vector>

/**
 * Example: Cache Shard Selection
 *
 * Three cache servers share a key space. Each key goes to the server
 * chring selects; the next distinct candidates are where replicas or
 * fail-over traffic go.
 *
 *   [cache-a] [cache-b] [cache-c]   (200 virtual nodes each)
 *
 * When cache-b is taken out, a new ring is built over the remaining
 * servers. Only the keys cache-b owned change server.
 */

struct server_t
{
    const char *name;
    const char *address;
};

static chr_ring_t *build_ring (const std::vector<server_t> &servers)
{
    std::vector<chr_node_t> nodes;
    for (const auto &server : servers) {
        chr_node_t node;
        node.key = server.name;
        node.key_len = std::string (server.name).size ();
        node.replicas = 200;
        node.value = const_cast<server_t *> (&server);
        nodes.push_back (node);
    }

    chr_ring_t *ring = chr_ring_new_ex (nodes.data (), nodes.size (), NULL);
    if (!ring)
        std::cerr << "Failed to build ring: " << chr_strerror (chr_errno ())
                  << std::endl;
    return ring;
}

static const server_t *owner (const chr_ring_t *ring, const std::string &key)
{
    const int node = chr_ring_lookup (ring, key.data (), key.size ());
    if (node < 0)
        return nullptr;
    return static_cast<const server_t *> (chr_ring_node_value (ring, node));
}

int main ()
{
    std::cout << "=== chring Cache Shard Selection Example ===" << std::endl;

    const std::vector<server_t> servers = {{"cache-a", "10.0.0.1:11211"},
                                           {"cache-b", "10.0.0.2:11211"},
                                           {"cache-c", "10.0.0.3:11211"}};
    const std::vector<std::string> keys = {
      "user:1001", "user:1002", "session:af31", "cart:77", "feed:home"};

    chr_ring_t *ring = build_ring (servers);
    if (!ring)
        return 1;

    std::cout << "\n1. Owners and fail-over order:" << std::endl;
    for (const auto &key : keys) {
        int candidates[3];
        const int n = chr_ring_candidates (ring, key.data (), key.size (),
                                           candidates, 3);
        if (n < 0) {
            std::cerr << "Lookup failed: " << chr_strerror (chr_errno ())
                      << std::endl;
            chr_ring_destroy (&ring);
            return 1;
        }

        std::cout << "   " << key << " ->";
        for (int i = 0; i < n; ++i) {
            const server_t *server = static_cast<const server_t *> (
              chr_ring_node_value (ring, candidates[i]));
            std::cout << " " << server->name << " (" << server->address
                      << ")";
        }
        std::cout << std::endl;
    }

    std::cout << "\n2. After removing cache-b:" << std::endl;
    const std::vector<server_t> remaining = {servers[0], servers[2]};
    chr_ring_t *smaller = build_ring (remaining);
    if (!smaller) {
        chr_ring_destroy (&ring);
        return 1;
    }

    for (const auto &key : keys) {
        const server_t *before = owner (ring, key);
        const server_t *after = owner (smaller, key);
        if (!before || !after)
            continue;
        std::cout << "   " << key << ": " << before->name << " -> "
                  << after->name
                  << (std::string (before->name) == after->name ? ""
                                                                : " (moved)")
                  << std::endl;
    }

    chr_ring_destroy (&smaller);
    chr_ring_destroy (&ring);
    return 0;
}
