// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <executor/aligned_buffer.h>
#include <test/test_abvm.h>

#include <boost/test/unit_test.hpp>

#include <cstdint>
#include <vector>

using namespace ABVM;

BOOST_FIXTURE_TEST_SUITE(aligned_buffer_tests, BasicTestingSetup)

static bool IsAligned16(const uint8_t* ptr)
{
    return reinterpret_cast<uintptr_t>(ptr) % 16 == 0;
}

BOOST_AUTO_TEST_CASE(owned_buffer_capacity)
{
    OwnedAlignedBuffer empty;
    BOOST_CHECK(empty.Empty());
    BOOST_CHECK_EQUAL(empty.Capacity(), 0U);
    BOOST_CHECK(IsAligned16(empty.Data()));
    BOOST_CHECK(!empty.SetLen(1));

    OwnedAlignedBuffer buffer = OwnedAlignedBuffer::WithCapacity(20);
    BOOST_CHECK_EQUAL(buffer.Capacity(), 20U);
    BOOST_CHECK_EQUAL(buffer.Size(), 0U);
    BOOST_CHECK(IsAligned16(buffer.Data()));
    BOOST_CHECK(buffer.SetLen(20));
    BOOST_CHECK(!buffer.SetLen(21));
    BOOST_CHECK_EQUAL(buffer.Size(), 20U);

    const std::vector<uint8_t> bytes{1, 2, 3, 4, 5};
    OwnedAlignedBuffer copy = OwnedAlignedBuffer::FromBytes(bytes.data(), 5);
    copy.EnsureCapacity(100);
    BOOST_CHECK_EQUAL(copy.Capacity(), 100U);
    BOOST_CHECK_EQUAL(copy.Size(), 5U);
    BOOST_CHECK(std::vector<uint8_t>(copy.Data(), copy.Data() + 5) == bytes);
    BOOST_CHECK(IsAligned16(copy.Data()));

    // Shrinking requests are ignored
    copy.EnsureCapacity(3);
    BOOST_CHECK_EQUAL(copy.Capacity(), 100U);

    // Growing on copy
    std::vector<uint8_t> large(300, 0xab);
    copy.CopyFrom(large.data(), 300);
    BOOST_CHECK_EQUAL(copy.Size(), 300U);
    BOOST_CHECK(copy.Capacity() >= 300U);
    BOOST_CHECK_EQUAL(copy.Data()[299], 0xab);
}

BOOST_AUTO_TEST_CASE(shared_buffer)
{
    SharedAlignedBuffer empty;
    BOOST_CHECK(empty.Empty());
    BOOST_CHECK(empty.Data() != nullptr);
    BOOST_CHECK(IsAligned16(empty.Data()));

    const std::vector<uint8_t> bytes{9, 8, 7};
    SharedAlignedBuffer shared = SharedAlignedBuffer::FromBytes(bytes);
    SharedAlignedBuffer copy = shared;
    BOOST_CHECK(copy.SharesWith(shared));
    BOOST_CHECK(copy.Data() == shared.Data());
    BOOST_CHECK(shared.ToVector() == bytes);
    BOOST_CHECK(!SharedAlignedBuffer::FromBytes(bytes).SharesWith(shared));

    // Owned copies never alias the shared allocation
    OwnedAlignedBuffer owned = shared.ToOwned(64);
    BOOST_CHECK_EQUAL(owned.Capacity(), 64U);
    BOOST_CHECK_EQUAL(owned.Size(), 3U);
    owned.Data()[0] = 0;
    BOOST_CHECK_EQUAL(shared.Data()[0], 9);

    OwnedAlignedBuffer exact = shared.ToOwned();
    BOOST_CHECK_EQUAL(exact.Capacity(), 3U);

    SharedAlignedBuffer back = std::move(owned).IntoShared();
    BOOST_CHECK_EQUAL(back.Size(), 3U);
    BOOST_CHECK_EQUAL(back.Data()[0], 0);
    BOOST_CHECK(IsAligned16(back.Data()));
}

BOOST_AUTO_TEST_SUITE_END()
