#include <memory>

#include <gtest/gtest.h>

#include "hpkc/aead/aead.hpp"
#include "hpkc/aead/export_only.hpp"

#include "test_util.hpp"

using hpkc::aead::AeadId;
using hpkc::core::StatusCode;
using hpkc_test::Bytes;

namespace {
    std::unique_ptr<hpkc::aead::Aead> make(AeadId id, const Bytes& key) {
        std::unique_ptr<hpkc::aead::Aead> out;
        const hpkc::core::Status s = hpkc::aead::make_aead(id, hpkc_test::view(key), &out);
        EXPECT_EQ(s.code, StatusCode::Ok);
        return out;
    }

    Bytes pattern(hpkc::core::u32 n, hpkc::core::u8 seed) {
        Bytes b(n);
        for (hpkc::core::u32 i = 0; i < n; ++i) {
            b[i] = static_cast<hpkc::core::u8>(seed + i * 7);
        }
        return b;
    }

    const AeadId kSealingIds[] = {AeadId::Aes128Gcm, AeadId::Aes256Gcm, AeadId::ChaCha20Poly1305};
} // namespace

TEST(AeadParams, PublishedSizes) {
    hpkc::aead::AeadParams p{};
    ASSERT_EQ(hpkc::aead::aead_params(0x0001, &p).code, StatusCode::Ok);
    EXPECT_EQ(p.id, AeadId::Aes128Gcm);
    EXPECT_EQ(p.key_size, 16u);
    EXPECT_EQ(p.nonce_size, 12u);
    EXPECT_EQ(p.tag_size, 16u);

    ASSERT_EQ(hpkc::aead::aead_params(0x0002, &p).code, StatusCode::Ok);
    EXPECT_EQ(p.key_size, 32u);
    EXPECT_EQ(p.nonce_size, 12u);
    EXPECT_EQ(p.tag_size, 16u);

    ASSERT_EQ(hpkc::aead::aead_params(0x0003, &p).code, StatusCode::Ok);
    EXPECT_EQ(p.id, AeadId::ChaCha20Poly1305);
    EXPECT_EQ(p.key_size, 32u);
    EXPECT_EQ(p.nonce_size, 12u);
    EXPECT_EQ(p.tag_size, 16u);

    ASSERT_EQ(hpkc::aead::aead_params(0xFFFF, &p).code, StatusCode::Ok);
    EXPECT_EQ(p.id, AeadId::ExportOnly);
    EXPECT_EQ(p.key_size, 0u);
    EXPECT_EQ(p.nonce_size, 128u);
    EXPECT_EQ(p.tag_size, 0u);
}

TEST(AeadParams, UnknownIdIsUnsupported) {
    hpkc::aead::AeadParams p{};
    const hpkc::core::Status s = hpkc::aead::aead_params(0x0004, &p);
    EXPECT_EQ(s.code, StatusCode::Unsupported);
    EXPECT_EQ(s.domain, hpkc::core::StatusDomain::Aead);
    EXPECT_EQ(s.aux, 0x0004u);

    EXPECT_EQ(hpkc::aead::aead_params(0x0001, nullptr).code, StatusCode::Invalid);
}

TEST(AeadFactory, RejectsWrongKeyLength) {
    std::unique_ptr<hpkc::aead::Aead> out;
    const Bytes short_key(15, 0x11);
    const hpkc::core::Status s = hpkc::aead::make_aead(AeadId::Aes128Gcm, hpkc_test::view(short_key), &out);
    EXPECT_EQ(s.code, StatusCode::Invalid);
    EXPECT_EQ(s.aux, 15u);
    EXPECT_EQ(out.get(), nullptr);

    const Bytes aes128_key(16, 0x11);
    EXPECT_EQ(hpkc::aead::make_aead(AeadId::Aes256Gcm, hpkc_test::view(aes128_key), &out).code, StatusCode::Invalid);
    EXPECT_EQ(hpkc::aead::make_aead(AeadId::ChaCha20Poly1305, hpkc_test::view(aes128_key), &out).code,
        StatusCode::Invalid);
    EXPECT_EQ(hpkc::aead::make_aead(AeadId::Aes128Gcm, {nullptr, 0}, &out).code, StatusCode::Invalid);
    EXPECT_EQ(hpkc::aead::make_aead(static_cast<AeadId>(0x0042), hpkc_test::view(aes128_key), &out).code,
        StatusCode::Unsupported);
}

TEST(AeadFactory, IsNoexceptAndRejectsNullOutput) {
    std::unique_ptr<hpkc::aead::Aead> out;
    static_assert(noexcept(hpkc::aead::make_aead(AeadId::Aes128Gcm, {nullptr, 0}, &out)));
    const Bytes key(16, 0x11);
    EXPECT_EQ(hpkc::aead::make_aead(AeadId::Aes128Gcm, hpkc_test::view(key), nullptr).code, StatusCode::Invalid);
    ASSERT_EQ(hpkc::aead::make_aead(AeadId::Aes128Gcm, hpkc_test::view(key), &out).code, StatusCode::Ok);
    EXPECT_NE(out.get(), nullptr);
}

TEST(AeadAesGcm, MatchesGcmReferenceVectors) {
    const Bytes key(16, 0x00);
    const Bytes nonce(12, 0x00);
    auto aead = make(AeadId::Aes128Gcm, key);
    ASSERT_NE(aead.get(), nullptr);

    Bytes empty;
    Bytes tag(16);
    ASSERT_EQ(aead->encrypt_in_place_detached(hpkc_test::view(nonce), {nullptr, 0}, hpkc_test::mut(empty),
                  hpkc_test::mut(tag)).code,
        StatusCode::Ok);
    EXPECT_EQ(hpkc_test::to_hex(tag), "58e2fccefa7e3061367f1d57a4e7455a");

    Bytes block(16, 0x00);
    ASSERT_EQ(aead->encrypt_in_place_detached(hpkc_test::view(nonce), {nullptr, 0}, hpkc_test::mut(block),
                  hpkc_test::mut(tag)).code,
        StatusCode::Ok);
    EXPECT_EQ(hpkc_test::to_hex(block), "0388dace60b6a392f328c2b971b2fe78");
    EXPECT_EQ(hpkc_test::to_hex(tag), "ab6e47d42cec13bdf53a67b21257bddf");
}

TEST(AeadRoundTrip, EncryptThenDecrypt) {
    for (AeadId id : kSealingIds) {
        SCOPED_TRACE(static_cast<int>(id));
        hpkc::aead::AeadParams p{};
        ASSERT_EQ(hpkc::aead::aead_params(static_cast<hpkc::core::u16>(id), &p).code, StatusCode::Ok);

        auto aead = make(id, pattern(p.key_size, 3));
        ASSERT_NE(aead.get(), nullptr);
        EXPECT_EQ(aead->id(), id);

        const Bytes nonce = pattern(p.nonce_size, 90);
        const Bytes aad = hpkc_test::from_hex("436f756e742d30");
        for (hpkc::core::u32 n : {0u, 1u, 15u, 16u, 17u, 1000u}) {
            const Bytes pt = pattern(n, 41);
            Bytes buf(pt);
            Bytes tag(p.tag_size);
            ASSERT_EQ(aead->encrypt_in_place_detached(hpkc_test::view(nonce), hpkc_test::view(aad),
                          hpkc_test::mut(buf), hpkc_test::mut(tag)).code,
                StatusCode::Ok);
            if (n > 0) {
                EXPECT_NE(buf, pt);
            }
            ASSERT_EQ(aead->decrypt_in_place_detached(hpkc_test::view(nonce), hpkc_test::view(aad),
                          hpkc_test::mut(buf), hpkc_test::view(tag)).code,
                StatusCode::Ok);
            EXPECT_EQ(buf, pt);
        }
    }
}

TEST(AeadRoundTrip, TamperingFailsAndZeroesOutput) {
    for (AeadId id : kSealingIds) {
        SCOPED_TRACE(static_cast<int>(id));
        hpkc::aead::AeadParams p{};
        ASSERT_EQ(hpkc::aead::aead_params(static_cast<hpkc::core::u16>(id), &p).code, StatusCode::Ok);
        auto aead = make(id, pattern(p.key_size, 5));
        ASSERT_NE(aead.get(), nullptr);

        const Bytes nonce = pattern(p.nonce_size, 1);
        const Bytes aad{'h', 'd', 'r'};
        const Bytes pt = pattern(64, 9);
        Bytes ct(pt);
        Bytes tag(p.tag_size);
        ASSERT_EQ(aead->encrypt_in_place_detached(hpkc_test::view(nonce), hpkc_test::view(aad),
                      hpkc_test::mut(ct), hpkc_test::mut(tag)).code,
            StatusCode::Ok);

        {
            Bytes buf(ct);
            Bytes bad_tag(tag);
            bad_tag[0] ^= 0x01;
            const hpkc::core::Status s = aead->decrypt_in_place_detached(hpkc_test::view(nonce),
                hpkc_test::view(aad), hpkc_test::mut(buf), hpkc_test::view(bad_tag));
            EXPECT_EQ(s.code, StatusCode::Crypto);
            EXPECT_EQ(buf, Bytes(buf.size(), 0x00));
        }
        {
            Bytes buf(ct);
            buf[10] ^= 0x80;
            EXPECT_EQ(aead->decrypt_in_place_detached(hpkc_test::view(nonce), hpkc_test::view(aad),
                          hpkc_test::mut(buf), hpkc_test::view(tag)).code,
                StatusCode::Crypto);
        }
        {
            Bytes buf(ct);
            const Bytes other_aad{'x'};
            EXPECT_EQ(aead->decrypt_in_place_detached(hpkc_test::view(nonce), hpkc_test::view(other_aad),
                          hpkc_test::mut(buf), hpkc_test::view(tag)).code,
                StatusCode::Crypto);
        }
    }
}

TEST(AeadRoundTrip, RejectsBadNonceAndTagLengths) {
    for (AeadId id : kSealingIds) {
        SCOPED_TRACE(static_cast<int>(id));
        hpkc::aead::AeadParams p{};
        ASSERT_EQ(hpkc::aead::aead_params(static_cast<hpkc::core::u16>(id), &p).code, StatusCode::Ok);
        auto aead = make(id, pattern(p.key_size, 5));
        ASSERT_NE(aead.get(), nullptr);

        Bytes buf = pattern(8, 2);
        Bytes tag(p.tag_size);
        const Bytes short_nonce(p.nonce_size - 1, 0x00);
        EXPECT_EQ(aead->encrypt_in_place_detached(hpkc_test::view(short_nonce), {nullptr, 0},
                      hpkc_test::mut(buf), hpkc_test::mut(tag)).code,
            StatusCode::Invalid);

        const Bytes nonce(p.nonce_size, 0x00);
        Bytes short_tag(p.tag_size - 1);
        EXPECT_EQ(aead->encrypt_in_place_detached(hpkc_test::view(nonce), {nullptr, 0}, hpkc_test::mut(buf),
                      hpkc_test::mut(short_tag)).code,
            StatusCode::Invalid);
        EXPECT_EQ(aead->decrypt_in_place_detached(hpkc_test::view(nonce), {nullptr, 0}, hpkc_test::mut(buf),
                      hpkc_test::view(short_tag)).code,
            StatusCode::Invalid);
    }
}

TEST(AeadExportOnly, AcceptsAnyKeyAndReportsSizes) {
    std::unique_ptr<hpkc::aead::Aead> out;
    ASSERT_EQ(hpkc::aead::make_aead(AeadId::ExportOnly, {nullptr, 0}, &out).code, StatusCode::Ok);
    ASSERT_NE(out.get(), nullptr);
    EXPECT_EQ(out->id(), AeadId::ExportOnly);
    EXPECT_EQ(out->key_size(), 0u);
    EXPECT_EQ(out->nonce_size(), 128u);
    EXPECT_EQ(out->tag_size(), 0u);

    const Bytes junk(77, 0xAB);
    ASSERT_EQ(hpkc::aead::make_aead(AeadId::ExportOnly, hpkc_test::view(junk), &out).code, StatusCode::Ok);
    EXPECT_EQ(out->nonce_size(), 128u);
}

TEST(AeadExportOnlyDeathTest, EncryptAborts) {
    hpkc::aead::ExportOnlyAead aead;
    Bytes nonce(128);
    Bytes buf(4);
    EXPECT_DEATH(
        {
            const hpkc::core::Status s = aead.encrypt_in_place_detached(hpkc_test::view(nonce), {nullptr, 0},
                hpkc_test::mut(buf), {nullptr, 0});
            (void)s;
        },
        "export-only");
}

TEST(AeadExportOnlyDeathTest, DecryptAborts) {
    hpkc::aead::ExportOnlyAead aead;
    Bytes nonce(128);
    Bytes buf(4);
    EXPECT_DEATH(
        {
            const hpkc::core::Status s = aead.decrypt_in_place_detached(hpkc_test::view(nonce), {nullptr, 0},
                hpkc_test::mut(buf), {nullptr, 0});
            (void)s;
        },
        "export-only");
}
