/* chring Lookup Tests */
/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "../testutil.hpp"

/*
 * Ring used by the exact placement tests:
 *
 *   100:A  200:B  300:A  400:B  500:A  600:B
 */
static const test_hash_entry_t placement[] = {
    {"A#0", 100}, {"A#1", 300}, {"A#2", 500},
    {"B#0", 200}, {"B#1", 400}, {"B#2", 600},
    {NULL, 0},
};

static chr_ring_t* placement_ring()
{
    const char *names[] = {"A", "B"};
    chr_ring_t *ring = test_table_ring_new(names, 2, 3, placement,
                                           CHR_COLLISION_DEDUP);
    TEST_ASSERT_NOT_NULL(ring);
    TEST_ASSERT_EQ(chr_ring_vnode_count(ring), 6);
    return ring;
}

/* Test: key is owned by the next virtual node clockwise */
static void test_lookup_successor()
{
    chr_ring_t *ring = placement_ring();

    TEST_ASSERT_STR_EQ(test_lookup_name(ring, "k0"), "A");
    TEST_ASSERT_STR_EQ(test_lookup_name(ring, "k50"), "A");
    TEST_ASSERT_STR_EQ(test_lookup_name(ring, "k101"), "B");
    TEST_ASSERT_STR_EQ(test_lookup_name(ring, "k250"), "A");
    TEST_ASSERT_STR_EQ(test_lookup_name(ring, "k399"), "B");
    TEST_ASSERT_STR_EQ(test_lookup_name(ring, "k599"), "B");

    test_ring_destroy(ring);
}

/* Test: a key hashing exactly onto a virtual node belongs to it */
static void test_lookup_exact_hit()
{
    chr_ring_t *ring = placement_ring();

    TEST_ASSERT_STR_EQ(test_lookup_name(ring, "k100"), "A");
    TEST_ASSERT_STR_EQ(test_lookup_name(ring, "k200"), "B");
    TEST_ASSERT_STR_EQ(test_lookup_name(ring, "k500"), "A");
    TEST_ASSERT_STR_EQ(test_lookup_name(ring, "k600"), "B");

    test_ring_destroy(ring);
}

/* Test: past the last virtual node the ring wraps to the first one */
static void test_lookup_wrap_around()
{
    chr_ring_t *ring = placement_ring();

    TEST_ASSERT_STR_EQ(test_lookup_name(ring, "k601"), "A");
    TEST_ASSERT_STR_EQ(test_lookup_name(ring, "k99999"), "A");
    /* Not in the table: hashes to UINT64_MAX */
    TEST_ASSERT_STR_EQ(test_lookup_name(ring, "unlisted"), "A");

    uint64_t hash = 0;
    TEST_SUCCESS(chr_ring_hash(ring, "unlisted", 8, &hash));
    TEST_ASSERT(hash == UINT64_MAX);

    test_ring_destroy(ring);
}

/* Test: lookups return input nodes and repeat the same answer */
static void test_lookup_membership_and_stability()
{
    const char *names[] = {"A", "B"};
    chr_ring_t *ring = test_ring_new(names, 2, 3);

    char buf[32];
    for (int i = 0; i < 1000; ++i) {
        size_t len = test_key(buf, sizeof(buf), i);
        int first = chr_ring_lookup(ring, buf, len);
        TEST_ASSERT(first == 0 || first == 1);
        int second = chr_ring_lookup(ring, buf, len);
        TEST_ASSERT_EQ(first, second);
    }

    const char *owner = test_lookup_name(ring, "some literal key");
    TEST_ASSERT(strcmp(owner, "A") == 0 || strcmp(owner, "B") == 0);
    TEST_ASSERT_STR_EQ(test_lookup_name(ring, "some literal key"), owner);

    test_ring_destroy(ring);
}

/* Test: two rings built from the same input agree on every key */
static void test_lookup_across_rings()
{
    const char *names[] = {"alpha", "beta", "gamma", "delta", "epsilon"};
    chr_ring_t *a = test_ring_new(names, 5, 200);
    chr_ring_t *b = test_ring_new(names, 5, 200);

    char buf[32];
    for (int i = 0; i < 5000; ++i) {
        size_t len = test_key(buf, sizeof(buf), i);
        TEST_ASSERT_EQ(chr_ring_lookup(a, buf, len), chr_ring_lookup(b, buf, len));
    }

    test_ring_destroy(a);
    test_ring_destroy(b);
}

/* Test: empty and binary keys are valid */
static void test_lookup_binary_keys()
{
    const char *names[] = {"A", "B", "C"};
    chr_ring_t *ring = test_ring_new(names, 3, 10);

    int node = chr_ring_lookup(ring, NULL, 0);
    TEST_ASSERT(node >= 0 && node < 3);
    TEST_ASSERT_EQ(chr_ring_lookup(ring, "", 0), node);

    const char key[] = {'\0', '\1', '\0', '\2'};
    node = chr_ring_lookup(ring, key, sizeof(key));
    TEST_ASSERT(node >= 0 && node < 3);
    TEST_ASSERT_EQ(chr_ring_lookup(ring, key, sizeof(key)), node);

    test_ring_destroy(ring);
}

/* Test: single node owns everything */
static void test_lookup_single_node()
{
    const char *names[] = {"only"};
    chr_ring_t *ring = test_ring_new(names, 1, 1);

    char buf[32];
    for (int i = 0; i < 100; ++i) {
        size_t len = test_key(buf, sizeof(buf), i);
        TEST_ASSERT_EQ(chr_ring_lookup(ring, buf, len), 0);
    }

    test_ring_destroy(ring);
}

int main()
{
    printf("=== chring Lookup Tests ===\n\n");

    RUN_TEST(test_lookup_successor);
    RUN_TEST(test_lookup_exact_hit);
    RUN_TEST(test_lookup_wrap_around);
    RUN_TEST(test_lookup_membership_and_stability);
    RUN_TEST(test_lookup_across_rings);
    RUN_TEST(test_lookup_binary_keys);
    RUN_TEST(test_lookup_single_node);

    printf("\n=== All Lookup Tests Passed ===\n");
    return 0;
}
