/* chring Error Handling Tests */
/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "../testutil.hpp"

/*
 * Error Handling Tests
 *
 * Every failure returns -1 or NULL and leaves the reason in chr_errno().
 */

/* Test 1: empty node list */
static void test_empty_node_list()
{
    chr_ring_t *ring = chr_ring_new(NULL, 0, 3);
    TEST_ASSERT_NULL(ring);
    TEST_ASSERT_EQ(chr_errno(), CHR_ENONODES);

    ring = chr_ring_new_ex(NULL, 0, NULL);
    TEST_ASSERT_NULL(ring);
    TEST_ASSERT_EQ(chr_errno(), CHR_ENONODES);
}

/* Test 2: replica count below one or above the limit */
static void test_invalid_replica_count()
{
    const char *names[] = {"A"};
    chr_ring_t *ring = chr_ring_new(names, 1, 0);
    TEST_ASSERT_NULL(ring);
    TEST_ASSERT_EQ(chr_errno(), CHR_EREPLICAS);

    ring = chr_ring_new(names, 1, -5);
    TEST_ASSERT_NULL(ring);
    TEST_ASSERT_EQ(chr_errno(), CHR_EREPLICAS);

    ring = chr_ring_new(names, 1, (1 << 20) + 1);
    TEST_ASSERT_NULL(ring);
    TEST_ASSERT_EQ(chr_errno(), CHR_EREPLICAS);

    /* One bad node fails the whole build */
    chr_node_t nodes[2] = {
        {"A", 1, 10, NULL},
        {"B", 1, 0, NULL},
    };
    ring = chr_ring_new_ex(nodes, 2, NULL);
    TEST_ASSERT_NULL(ring);
    TEST_ASSERT_EQ(chr_errno(), CHR_EREPLICAS);
}

/* Test 3: empty list is reported before replica count */
static void test_error_precedence()
{
    chr_ring_t *ring = chr_ring_new(NULL, 0, 0);
    TEST_ASSERT_NULL(ring);
    TEST_ASSERT_EQ(chr_errno(), CHR_ENONODES);
}

/* Test 4: invalid options */
static void test_invalid_options()
{
    chr_node_t nodes[1] = {{"A", 1, 10, NULL}};
    chr_ring_opts_t opts;

    chr_ring_opts_init(&opts);
    opts.hash = 42;
    TEST_ASSERT_NULL(chr_ring_new_ex(nodes, 1, &opts));
    TEST_ASSERT_EQ(chr_errno(), CHR_EINVAL);

    chr_ring_opts_init(&opts);
    opts.collision = 7;
    TEST_ASSERT_NULL(chr_ring_new_ex(nodes, 1, &opts));
    TEST_ASSERT_EQ(chr_errno(), CHR_EINVAL);

    /* Key pointer missing for a non-empty key */
    chr_node_t bad[1] = {{NULL, 4, 10, NULL}};
    TEST_ASSERT_NULL(chr_ring_new_ex(bad, 1, NULL));
    TEST_ASSERT_EQ(chr_errno(), CHR_EINVAL);

    const char *names[] = {"A", NULL};
    TEST_ASSERT_NULL(chr_ring_new(names, 2, 10));
    TEST_ASSERT_EQ(chr_errno(), CHR_EINVAL);

    TEST_ASSERT_NULL(chr_ring_new(NULL, 2, 10));
    TEST_ASSERT_EQ(chr_errno(), CHR_EINVAL);
}

/* Test 5: NULL ring and bad arguments on a valid ring */
static void test_invalid_arguments()
{
    TEST_FAILURE_ERRNO(chr_ring_lookup(NULL, "k", 1), CHR_EINVAL);
    TEST_FAILURE_ERRNO(chr_ring_candidates(NULL, "k", 1, NULL, 0), CHR_EINVAL);
    TEST_ASSERT_EQ(chr_ring_node_count(NULL), 0);
    TEST_ASSERT_EQ(chr_ring_vnode_count(NULL), 0);

    const char *names[] = {"A", "B"};
    chr_ring_t *ring = test_ring_new(names, 2, 4);

    TEST_FAILURE_ERRNO(chr_ring_lookup(ring, NULL, 3), CHR_EINVAL);

    int nodes[2];
    TEST_FAILURE_ERRNO(chr_ring_candidates(ring, "k", 1, nodes, -1), CHR_EINVAL);
    TEST_FAILURE_ERRNO(chr_ring_candidates(ring, "k", 1, NULL, 2), CHR_EINVAL);

    TEST_FAILURE_ERRNO(chr_ring_hash(ring, "k", 1, NULL), CHR_EINVAL);
    TEST_FAILURE_ERRNO(chr_ring_vnode(ring, 8, NULL, NULL), CHR_EINVAL);
    TEST_FAILURE_ERRNO(chr_ring_node_replicas(ring, 2), CHR_EINVAL);
    TEST_FAILURE_ERRNO(chr_ring_node_replicas(ring, -1), CHR_EINVAL);

    TEST_ASSERT_NULL(chr_ring_node_key(ring, 5, NULL));
    TEST_ASSERT_EQ(chr_errno(), CHR_EINVAL);

    test_ring_destroy(ring);

    /* Destroying NULL is a no-op */
    chr_ring_destroy(NULL);
    chr_ring_t *none = NULL;
    chr_ring_destroy(&none);
}

/* Test 6: hash helper argument checks */
static void test_hash_arguments()
{
    uint64_t value = 0;
    TEST_FAILURE_ERRNO(chr_hash(99, "x", 1, &value), CHR_EINVAL);
    TEST_FAILURE_ERRNO(chr_hash(CHR_HASH_MD5, "x", 1, NULL), CHR_EINVAL);
    TEST_FAILURE_ERRNO(chr_hash(CHR_HASH_MD5, NULL, 1, &value), CHR_EINVAL);
    TEST_SUCCESS(chr_hash(CHR_HASH_MD5, NULL, 0, &value));
}

/* Test 7: error strings */
static void test_strerror()
{
    TEST_ASSERT_STR_EQ(chr_strerror(CHR_ENONODES), "Node list is empty");
    TEST_ASSERT_STR_EQ(chr_strerror(CHR_EREPLICAS), "Invalid replica count");
    TEST_ASSERT_STR_EQ(chr_strerror(CHR_ECOLLISION), "Virtual node hash collision");
    TEST_ASSERT_STR_EQ(chr_strerror(CHR_EEMPTYRING), "Ring has no virtual nodes");
    TEST_ASSERT_STR_EQ(chr_strerror(CHR_EINVAL), "Invalid argument");
    TEST_ASSERT_STR_EQ(chr_strerror(12345), "Unknown error");
}

int main()
{
    printf("=== chring Error Handling Tests ===\n\n");

    RUN_TEST(test_empty_node_list);
    RUN_TEST(test_invalid_replica_count);
    RUN_TEST(test_error_precedence);
    RUN_TEST(test_invalid_options);
    RUN_TEST(test_invalid_arguments);
    RUN_TEST(test_hash_arguments);
    RUN_TEST(test_strerror);

    printf("\n=== All Error Handling Tests Passed ===\n");
    return 0;
}
