#include <doctest/doctest.h>
#include <pngme/png.hh>
#include <pngme/exceptions.hh>

#include <sstream>
#include <string>
#include <vector>

#include "test_utils.hh"

using namespace pngme;

namespace {
    chunk make_chunk(std::string_view type, std::string_view text) {
        return chunk(chunk_type::from_string(type), to_bytes(text));
    }

    png testing_png() {
        std::vector<chunk> chunks;
        chunks.push_back(make_chunk("FrSt", "I am the first chunk"));
        chunks.push_back(make_chunk("miDl", "I am another chunk"));
        chunks.push_back(make_chunk("LASt", "I am the last chunk"));
        return png(std::move(chunks));
    }

    std::vector<std::uint8_t> stream_of(const std::vector<chunk>& chunks) {
        auto bytes = signature_bytes();
        for (const auto& c : chunks) {
            auto frame = c.to_bytes();
            bytes.insert(bytes.end(), frame.begin(), frame.end());
        }
        return bytes;
    }

    png_error parse_failure(const std::vector<std::uint8_t>& bytes) {
        try {
            (void)png::parse(bytes);
        } catch (const png_error& e) {
            return e;
        }
        FAIL("parse succeeded");
        return png_error(png_error::reason::bad_signature, "");
    }
}

TEST_SUITE("PNG") {
    TEST_CASE("png construction") {
        SUBCASE("default has signature and no chunks") {
            png p;
            CHECK(p.header() == png::standard_header);
            CHECK(p.chunks().empty());
            CHECK(p.to_bytes() == signature_bytes());
        }

        SUBCASE("from chunk list") {
            auto p = testing_png();
            CHECK(p.chunks().size() == 3);
            CHECK(p.chunks()[0].type().to_string() == "FrSt");
            CHECK(p.chunks()[2].type().to_string() == "LASt");
        }
    }

    TEST_CASE("png parsing") {
        SUBCASE("signature only") {
            auto p = png::parse(signature_bytes());
            CHECK(p.chunks().empty());
            CHECK(p == png());
        }

        SUBCASE("chunk sequence") {
            auto expected = testing_png();
            auto p = png::parse(stream_of(expected.chunks()));
            CHECK(p == expected);
            CHECK(p.chunks()[1].data_as_string() == "I am another chunk");
        }

        SUBCASE("real image") {
            auto data = load_test_data("small.png");
            auto p = png::parse(data);
            REQUIRE(p.chunks().size() == 4);
            CHECK(p.chunks()[0].type().to_string() == "IHDR");
            CHECK(p.chunks()[0].length() == 13);
            CHECK(p.chunks()[1].type().to_string() == "tEXt");
            CHECK(p.chunks()[2].type().to_string() == "IDAT");
            // IEND is kept as an ordinary chunk
            CHECK(p.chunks()[3].type().to_string() == "IEND");
            CHECK(p.chunks()[3].length() == 0);
            CHECK(p.to_bytes() == data);
        }

        SUBCASE("container round trip") {
            auto data = load_test_data("small.png");
            auto p = png::parse(data);
            CHECK(png::parse(p.to_bytes()) == p);
        }

        SUBCASE("bad signature") {
            auto data = load_test_data("small.png");
            for (std::size_t i = 0; i < 8; i++) {
                auto corrupt = data;
                corrupt[i] ^= 0x01;
                CHECK(parse_failure(corrupt).why() == png_error::reason::bad_signature);
            }

            CHECK(parse_failure({}).why() == png_error::reason::bad_signature);
            std::vector<std::uint8_t> short_sig(png::standard_header.begin(), png::standard_header.begin() + 7);
            CHECK(parse_failure(short_sig).why() == png_error::reason::bad_signature);
            CHECK(parse_failure(to_bytes("GIF89a\x01\x02")).why() == png_error::reason::bad_signature);
        }

        SUBCASE("failing chunk is identified") {
            auto chunks = testing_png().chunks();
            auto bytes = stream_of(chunks);

            // Corrupt the payload of the second chunk
            std::size_t second = 8 + chunk::min_size + chunks[0].length();
            bytes[second + 8] ^= 0x40;

            auto e = parse_failure(bytes);
            CHECK(e.why() == png_error::reason::chunk_parse_failed);
            CHECK(e.index() == 1);
            CHECK(e.offset() == second);
            CHECK(e.cause() == chunk_error::reason::checksum_mismatch);
        }

        SUBCASE("invalid type code in sequence") {
            auto bytes = signature_bytes();
            auto frame = make_frame(2, "ab#d", "xy", 0);
            bytes.insert(bytes.end(), frame.begin(), frame.end());

            auto e = parse_failure(bytes);
            CHECK(e.index() == 0);
            CHECK(e.cause() == chunk_error::reason::invalid_type_code);
        }

        SUBCASE("truncated tail") {
            auto data = load_test_data("small.png");

            // Cut inside the length field of IEND
            std::vector<std::uint8_t> cut(data.begin(), data.end() - 10);
            auto e = parse_failure(cut);
            CHECK(e.index() == 3);
            CHECK(e.cause() == chunk_error::reason::incomplete);

            // Cut inside the IDAT payload: the declared length overruns the stream
            std::vector<std::uint8_t> cut2(data.begin(), data.end() - 20);
            e = parse_failure(cut2);
            CHECK(e.index() == 2);
            CHECK(e.cause() == chunk_error::reason::length_mismatch);
        }

        SUBCASE("trailing garbage") {
            auto data = load_test_data("small.png");
            data.push_back(0x00);
            auto e = parse_failure(data);
            CHECK(e.index() == 4);
            CHECK(e.cause() == chunk_error::reason::incomplete);
        }
    }

    TEST_CASE("png editing") {
        SUBCASE("append chunk") {
            auto p = testing_png();
            p.append_chunk(make_chunk("TeSt", "Message"));
            REQUIRE(p.chunks().size() == 4);
            CHECK(p.chunks().back().type().to_string() == "TeSt");
            CHECK(p.chunks().back().data_as_string() == "Message");
        }

        SUBCASE("chunk by type") {
            auto p = testing_png();
            const chunk* c = p.chunk_by_type("FrSt");
            REQUIRE(c != nullptr);
            CHECK(c->data_as_string() == "I am the first chunk");

            CHECK(p.chunk_by_type("nOpE") == nullptr);
            // Matching is case sensitive and exact
            CHECK(p.chunk_by_type("frst") == nullptr);
            CHECK(p.chunk_by_type("FrS") == nullptr);
        }

        SUBCASE("first match wins") {
            auto p = testing_png();
            p.append_chunk(make_chunk("FrSt", "duplicate"));
            CHECK(p.chunk_by_type("FrSt")->data_as_string() == "I am the first chunk");

            auto removed = p.remove_first_chunk("FrSt");
            CHECK(removed.data_as_string() == "I am the first chunk");
            CHECK(p.chunk_by_type("FrSt")->data_as_string() == "duplicate");
        }

        SUBCASE("remove keeps order") {
            auto p = testing_png();
            auto removed = p.remove_first_chunk("miDl");
            CHECK(removed.type().to_string() == "miDl");
            REQUIRE(p.chunks().size() == 2);
            CHECK(p.chunks()[0].type().to_string() == "FrSt");
            CHECK(p.chunks()[1].type().to_string() == "LASt");
        }

        SUBCASE("remove missing chunk") {
            auto p = testing_png();
            try {
                (void)p.remove_first_chunk("nOpE");
                FAIL("removal of missing chunk succeeded");
            } catch (const png_error& e) {
                CHECK(e.why() == png_error::reason::chunk_not_found);
            }
            CHECK(p.chunks().size() == 3);
        }

        SUBCASE("hide, reveal and remove a message") {
            png p;
            p.append_chunk(make_chunk("ruSt", "hidden"));

            auto reparsed = png::parse(p.to_bytes());
            const chunk* c = reparsed.chunk_by_type("ruSt");
            REQUIRE(c != nullptr);
            CHECK(c->data_as_string() == "hidden");

            auto removed = reparsed.remove_first_chunk("ruSt");
            CHECK(removed.data_as_string() == "hidden");
            CHECK(reparsed.chunks().empty());
            CHECK(reparsed.to_bytes() == signature_bytes());
        }

        SUBCASE("message appended to a real image") {
            auto p = png::parse(load_test_data("small.png"));
            p.append_chunk(make_chunk("ruSt", "after the end"));

            auto reparsed = png::parse(p.to_bytes());
            CHECK(reparsed.chunks().size() == 5);
            CHECK(reparsed.chunk_by_type("ruSt")->data_as_string() == "after the end");
            CHECK(reparsed.chunk_by_type("IHDR") == &reparsed.chunks()[0]);
        }
    }

    TEST_CASE("png display") {
        std::ostringstream os;
        os << testing_png();
        auto text = os.str();
        CHECK(text.find("header: [137, 80, 78, 71, 13, 10, 26, 10]") != std::string::npos);
        CHECK(text.find("chunks: 3") != std::string::npos);
        CHECK(text.find("type: FrSt, data: I am the first chunk") != std::string::npos);
        CHECK(text.find("type: LASt") != std::string::npos);
    }
}
