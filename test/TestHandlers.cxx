#include <gtest/gtest.h>

#include "Environment.hxx"
#include "PathResolver.hxx"
#include "handlers.hxx"

#include "FitsFixtures.hxx"

#include <json/json.h>

#include <sstream>

using namespace fitsview;
using fitsview::test::TempDir;
using fitsview::test::decode_le;

class HandlersTest : public ::testing::Test {
protected:
    void SetUp() override {
        test::write_multi_hdu_file(dir_ / "multi.fits");
        test::write_non_fits_file(dir_ / "broken.fits");
    }

    Response get(std::string const& endpoint, std::string const& query,
                 std::string const& method = "GET") {
        Environment env(method, endpoint, query);
        DataRootResolver resolver(dir_.path());
        return dispatch(env, resolver);
    }

    static Json::Value parse_json(Response const& response) {
        Json::CharReaderBuilder builder;
        Json::Value value;
        std::string errors;
        std::istringstream in(response.get_body_string());
        EXPECT_TRUE(Json::parseFromStream(builder, in, &value, &errors)) << errors;
        return value;
    }

    static std::string error_of(Response const& response) {
        std::string const* type = response.find_header("Content-Type");
        EXPECT_TRUE(type != nullptr && *type == "application/json; charset=utf-8");
        return parse_json(response)["error"].asString();
    }

    static std::string header(Response const& response, std::string const& name) {
        std::string const* value = response.find_header(name);
        return value ? *value : std::string();
    }

    TempDir dir_;
};

TEST_F(HandlersTest, DescribesEveryHdu) {
    Response response = get("/metadata", "path=multi.fits");
    ASSERT_EQ(response.get_response_code().get_code(), 200);
    Json::Value body = parse_json(response);
    EXPECT_EQ(body["path"].asString(), "multi.fits");
    EXPECT_EQ(body["n_extensions"].asInt(), 3);
    Json::Value const& hdus = body["hdus"];
    ASSERT_EQ(hdus.size(), 3u);

    EXPECT_EQ(hdus[0]["index"].asInt(), 0);
    EXPECT_EQ(hdus[0]["name"].asString(), "PRIMARY");
    EXPECT_EQ(hdus[0]["type"].asString(), "PrimaryHDU");
    EXPECT_EQ(hdus[0]["arrayType"].asString(), "f32");
    ASSERT_EQ(hdus[0]["shape"].size(), 2u);
    EXPECT_EQ(hdus[0]["shape"][0].asInt(), 10);
    EXPECT_EQ(hdus[0]["shape"][1].asInt(), 10);
    EXPECT_NE(hdus[0]["header"].asString().find("OBJECT  = 'Test Object'"),
              std::string::npos);

    EXPECT_EQ(hdus[1]["name"].asString(), "SCI");
    EXPECT_EQ(hdus[1]["type"].asString(), "ImageHDU");
    EXPECT_EQ(hdus[1]["arrayType"].asString(), "i16");
    EXPECT_EQ(hdus[1]["shape"][0].asInt(), 5);
    EXPECT_EQ(hdus[1]["shape"][1].asInt(), 10);

    EXPECT_EQ(hdus[2]["type"].asString(), "BinTableHDU");
    EXPECT_TRUE(hdus[2]["shape"].isNull());
    EXPECT_TRUE(hdus[2]["arrayType"].isNull());
}

TEST_F(HandlersTest, MetadataReportsMissingFile) {
    Response response = get("/metadata", "path=nope.fits");
    EXPECT_EQ(response.get_response_code().get_code(), 404);
    EXPECT_EQ(error_of(response), "File not found: nope.fits");
    EXPECT_EQ(header(response, "Cache-Control"), "no-cache");
}

TEST_F(HandlersTest, MetadataReportsUnreadableFile) {
    Response response = get("/metadata", "path=broken.fits");
    EXPECT_EQ(response.get_response_code().get_code(), 500);
    EXPECT_EQ(error_of(response).compare(0, 23, "Error reading FITS file"), 0);
}

TEST_F(HandlersTest, SlicesFloat32Image) {
    Response response = get("/slice", "path=multi.fits&hdu=0&slices=0:2,0:3");
    ASSERT_EQ(response.get_response_code().get_code(), 200);
    EXPECT_EQ(header(response, "Content-Type"), "application/octet-stream");
    EXPECT_EQ(header(response, "X-FITS-Shape"), "[2,3]");
    EXPECT_EQ(header(response, "X-FITS-Type"), "f32");
    EXPECT_EQ(header(response, "Content-Encoding"), "");
    EXPECT_EQ(decode_le<float>(response.get_body()),
              std::vector<float>({0.0f, 1.0f, 2.0f, 10.0f, 11.0f, 12.0f}));
}

TEST_F(HandlersTest, DefaultsToPrimaryHdu) {
    Response response = get("/slice", "path=multi.fits&slices=9:10,9:10");
    ASSERT_EQ(response.get_response_code().get_code(), 200);
    EXPECT_EQ(decode_le<float>(response.get_body()), std::vector<float>(1, 99.0f));
}

TEST_F(HandlersTest, SlicesExtension) {
    Response response = get("/slice", "path=multi.fits&hdu=1&slices=4:5,0:10");
    ASSERT_EQ(response.get_response_code().get_code(), 200);
    EXPECT_EQ(header(response, "X-FITS-Shape"), "[1,10]");
    EXPECT_EQ(header(response, "X-FITS-Type"), "i16");
    std::vector<int16_t> values = decode_le<int16_t>(response.get_body());
    ASSERT_EQ(values.size(), 10u);
    EXPECT_EQ(values.front(), 40);
    EXPECT_EQ(values.back(), 49);
}

TEST_F(HandlersTest, CompressesOnRequest) {
    Response plain = get("/slice", "path=multi.fits&slices=0:10,0:10");
    Response packed = get("/slice", "path=multi.fits&slices=0:10,0:10&gzip=true");
    ASSERT_EQ(packed.get_response_code().get_code(), 200);
    EXPECT_EQ(header(packed, "Content-Encoding"), "gzip");
    EXPECT_EQ(header(packed, "X-FITS-Shape"), "[10,10]");
    EXPECT_EQ(test::gunzip(packed.get_body()), plain.get_body());

    Response off = get("/slice", "path=multi.fits&slices=0:1,0:1&gzip=no");
    EXPECT_EQ(header(off, "Content-Encoding"), "");
    EXPECT_EQ(get("/slice", "path=multi.fits&slices=0:1,0:1&gzip=maybe")
                      .get_response_code()
                      .get_code(),
              400);
}

TEST_F(HandlersTest, RejectsHduOutOfRange) {
    Response response = get("/slice", "path=multi.fits&hdu=99&slices=0:1,0:1");
    EXPECT_EQ(response.get_response_code().get_code(), 400);
    EXPECT_EQ(error_of(response), "HDU index 99 out of range (file has 3 HDUs)");
}

TEST_F(HandlersTest, RejectsInvalidHduValue) {
    EXPECT_EQ(get("/slice", "path=multi.fits&hdu=-1&slices=0:1,0:1")
                      .get_response_code()
                      .get_code(),
              400);
    EXPECT_EQ(get("/slice", "path=multi.fits&hdu=one&slices=0:1,0:1")
                      .get_response_code()
                      .get_code(),
              400);
}

TEST_F(HandlersTest, RejectsStep) {
    Response response = get("/slice", "path=multi.fits&slices=0:10:2,0:10");
    EXPECT_EQ(response.get_response_code().get_code(), 400);
    EXPECT_EQ(error_of(response), "Invalid slice format: '0:10:2'. Expected 'start:stop'.");
}

TEST_F(HandlersTest, RejectsTableHdu) {
    Response response = get("/slice", "path=multi.fits&hdu=2&slices=0:1");
    EXPECT_EQ(response.get_response_code().get_code(), 400);
    EXPECT_EQ(error_of(response), "HDU 2 has no data");
}

TEST_F(HandlersTest, RejectsWrongAxisCountAndBounds) {
    Response count = get("/slice", "path=multi.fits&slices=0:2");
    EXPECT_EQ(count.get_response_code().get_code(), 400);
    EXPECT_EQ(error_of(count),
              "Number of slice dimensions (1) does not match data dimensions (2). "
              "Data shape: [10, 10]");

    Response bounds = get("/slice", "path=multi.fits&slices=0:10,0:11");
    EXPECT_EQ(bounds.get_response_code().get_code(), 400);
    EXPECT_EQ(error_of(bounds),
              "Slice [0:11] on axis 1 out of bounds for dimension size 10. "
              "Data shape: [10, 10]");
}

TEST_F(HandlersTest, SliceReportsMissingFile) {
    Response response = get("/slice", "path=missing.fits&slices=0:1,0:1");
    EXPECT_EQ(response.get_response_code().get_code(), 404);
    EXPECT_EQ(error_of(response), "File not found: missing.fits");
}

TEST_F(HandlersTest, ChecksSliceSyntaxBeforePath) {
    Response response = get("/slice", "path=missing.fits&slices=3:1");
    EXPECT_EQ(response.get_response_code().get_code(), 400);
    EXPECT_EQ(error_of(response), "Start must be less than stop: '3:1'");
}

TEST_F(HandlersTest, SliceReportsUnreadableFile) {
    Response response = get("/slice", "path=broken.fits&slices=0:1,0:1");
    EXPECT_EQ(response.get_response_code().get_code(), 500);
    EXPECT_EQ(error_of(response).compare(0, 23, "Error reading FITS data"), 0);
}

TEST_F(HandlersTest, ValidatesRequest) {
    EXPECT_EQ(get("/slice", "path=multi.fits").get_response_code().get_code(), 400);
    EXPECT_EQ(get("/metadata", "").get_response_code().get_code(), 400);
    EXPECT_EQ(get("/metadata", "path=multi.fits&hdu=0").get_response_code().get_code(),
              400);
    EXPECT_EQ(get("/metadata", "path=multi.fits&path=multi.fits")
                      .get_response_code()
                      .get_code(),
              400);
    EXPECT_EQ(get("/cutout", "path=multi.fits").get_response_code().get_code(), 404);

    Response post = get("/metadata", "path=multi.fits", "POST");
    EXPECT_EQ(post.get_response_code().get_code(), 405);
    EXPECT_EQ(header(post, "Allow"), "GET, HEAD");
}

TEST_F(HandlersTest, WritesNonParsedHeaders) {
    Response response = get("/slice", "path=multi.fits&slices=0:2,0:3", "HEAD");
    ASSERT_EQ(response.get_response_code().get_code(), 200);

    std::ostringstream full;
    response.write(full, "HTTP/1.1");
    std::string const text = full.str();
    EXPECT_EQ(text.compare(0, 17, "HTTP/1.1 200 OK\r\n"), 0);
    EXPECT_NE(text.find("X-FITS-Type: f32\r\n"), std::string::npos);
    EXPECT_NE(text.find("Content-Length: 24\r\n\r\n"), std::string::npos);
    EXPECT_EQ(text.size() - (text.find("\r\n\r\n") + 4), 24u);

    std::ostringstream head;
    response.write(head, "HTTP/1.1", false);
    EXPECT_EQ(head.str(), text.substr(0, text.size() - 24));
}
