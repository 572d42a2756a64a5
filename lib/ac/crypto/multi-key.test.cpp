/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */

#include <ac/common/test.hpp>
#include <ac/bcs.hpp>
#include <ac/crypto/multi-ed25519.hpp>
#include <ac/crypto/multi-key.hpp>

using namespace aptos_client;
using namespace aptos_client::crypto;

suite crypto_multi_key_suite = [] {
    "crypto::multi_key"_test = [] {
        static const std::string_view msg { "multi-signer message" };

        "bitmap"_test = [] {
            const auto bm = signer_bitmap::from_indices({ 0, 9, 31 });
            test_hex("80400001", bm.bytes());
            test_same(size_t { 3 }, bm.count());
            expect(bm.indices() == std::vector<uint8_t> { 0, 9, 31 });
            test_hex("c0", signer_bitmap::from_indices({ 1, 0 }).bytes());
            test_hex("c0000000", signer_bitmap::from_indices({ 0, 1 }).fixed());
            expect(throws<bitmap_error>([] { signer_bitmap::from_indices({ 1, 1 }); }));
            expect(throws<bitmap_error>([] { signer_bitmap::from_indices({ 32 }); }));
            expect(throws<bitmap_error>([] { signer_bitmap { uint8_vector::from_hex("0000000000") }; }));
        };
        "cross-platform signature vector"_test = [] {
            const auto data = uint8_vector::from_hex("020140118d6ebe543aaf3a541453f98a5748ab5b9e3f96d781b8c0a43740af2b65c03529fdf62b7de7aad9150770e0994dc4e0714795fdebf312be66cd0550c607755e00401a90421453aa53fa5a7aa3dfe70d913823cbf087bf372a762219ccc824d3a0eeecccaa9d34f22db4366aec61fb6c204d2440f4ed288bc7cc7e407b766723a60901c0");
            const auto sig = bcs::deserialize<multi_key_signature>(data);
            test_same(size_t { 2 }, sig.sigs.size());
            test_same(any_signature::variant_type::secp256k1 == sig.sigs[0].variant(), true);
            test_same(any_signature::variant_type::ed25519 == sig.sigs[1].variant(), true);
            expect(sig.bitmap.indices() == std::vector<uint8_t> { 0, 1 });
            expect(bcs::serialize(sig) == data);
        };
        "threshold semantics"_test = [] {
            const auto sk1 = ed25519::private_key::generate();
            const auto sk2 = secp256k1::private_key::generate();
            const auto sk3 = ed25519::private_key::generate();
            const auto mk = multi_key::make({ any_public_key { sk1.pub_key() }, any_public_key { sk2.pub_key() }, any_public_key { sk3.pub_key() } }, 2);
            const auto good = multi_key_signature::make({
                indexed_signature { 2, any_signature { sk3.sign(buffer { msg }) } },
                indexed_signature { 1, any_signature { sk2.sign(buffer { msg }) } }
            });
            expect(good.bitmap.indices() == std::vector<uint8_t> { 1, 2 });
            expect(mk.verify(buffer { msg }, good));
            expect(!mk.verify(buffer { std::string_view { "other" } }, good));
            const auto single = multi_key_signature::make({ indexed_signature { 0, any_signature { sk1.sign(buffer { msg }) } } });
            expect(!mk.verify(buffer { msg }, single)) << "below the threshold";
            const auto misplaced = multi_key_signature::make({
                indexed_signature { 0, any_signature { sk3.sign(buffer { msg }) } },
                indexed_signature { 1, any_signature { sk2.sign(buffer { msg }) } }
            });
            expect(!mk.verify(buffer { msg }, misplaced));
            const auto out_of_range = multi_key_signature::make({
                indexed_signature { 1, any_signature { sk2.sign(buffer { msg }) } },
                indexed_signature { 5, any_signature { sk3.sign(buffer { msg }) } }
            });
            expect(!mk.verify(buffer { msg }, out_of_range));
            test_hex("60", good.bitmap.bytes());
            auto padded = good;
            padded.bitmap = signer_bitmap { uint8_vector::from_hex("6000") };
            expect(padded.bitmap.indices() == good.bitmap.indices());
            expect(!mk.verify(buffer { msg }, padded)) << "the bitmap is longer than the key set";
            expect(throws<bitmap_error>([&] {
                multi_key_signature::make({ indexed_signature { 1, any_signature { sk2.sign(buffer { msg }) } },
                    indexed_signature { 1, any_signature { sk2.sign(buffer { msg }) } } });
            }));
            test_same(mk.auth_key(), authentication_key::from_bytes_and_scheme(bcs::serialize(mk), auth_scheme::multi_key));
            expect(mk == bcs::deserialize<multi_key>(bcs::serialize(mk)));
            expect(throws<crypto_error>([&] { multi_key::make({ any_public_key { sk1.pub_key() } }, 2); }));
        };
        "count mismatch on the wire"_test = [] {
            // one ed25519 signature but two bits set
            uint8_vector data = uint8_vector::from_hex("010040");
            data << static_cast<buffer>(uint8_vector(64));
            data << static_cast<buffer>(uint8_vector::from_hex("01c0"));
            expect(throws<bcs::error>([&] { bcs::deserialize<multi_key_signature>(data); }));
        };
    };

    "crypto::multi_ed25519"_test = [] {
        static const std::string_view msg { "multi-ed25519 message" };
        const std::vector<ed25519::private_key> sks { ed25519::private_key::generate(), ed25519::private_key::generate(), ed25519::private_key::generate() };
        const auto vk = multi_ed25519::public_key::make({ sks[0].pub_key(), sks[1].pub_key(), sks[2].pub_key() }, 2);

        "wire format"_test = [&] {
            const auto data = bcs::serialize(vk);
            test_same(size_t { 1 + 3 * 32 + 1 }, data.size());
            test_same(uint8_t { 97 }, data[0]);
            test_same(uint8_t { 2 }, data.back());
            expect(vk == bcs::deserialize<multi_ed25519::public_key>(data));
            test_same(vk.auth_key(), authentication_key::from_bytes_and_scheme(vk.bytes(), auth_scheme::multi_ed25519));
            const auto sig = multi_ed25519::signature::from_indexed({ { 2, sks[2].sign(buffer { msg }) }, { 0, sks[0].sign(buffer { msg }) } });
            const auto sig_data = bcs::serialize(sig);
            test_same(size_t { 2 + 2 * 64 + 4 }, sig_data.size());
            test_hex("a0000000", buffer { sig_data.data() + sig_data.size() - 4, 4 });
            expect(sig == bcs::deserialize<multi_ed25519::signature>(sig_data));
        };
        "threshold semantics"_test = [&] {
            const auto two = multi_ed25519::signature::from_indexed({ { 0, sks[0].sign(buffer { msg }) }, { 1, sks[1].sign(buffer { msg }) } });
            expect(vk.verify(buffer { msg }, two));
            const auto one = multi_ed25519::signature::from_indexed({ { 1, sks[1].sign(buffer { msg }) } });
            expect(!vk.verify(buffer { msg }, one));
            const auto swapped = multi_ed25519::signature::from_indexed({ { 0, sks[1].sign(buffer { msg }) }, { 1, sks[0].sign(buffer { msg }) } });
            expect(!vk.verify(buffer { msg }, swapped));
            auto mismatch = two;
            mismatch.sigs.pop_back();
            expect(!vk.verify(buffer { msg }, mismatch));
            expect(throws<crypto_error>([&] { multi_ed25519::public_key::make({ sks[0].pub_key() }, 0); }));
        };
    };
};
