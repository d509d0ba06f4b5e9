#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "../src/core/NeuroDecodeExceptions.h"
#include "../src/io/CompatUtils.h"
#include "../src/io/GzFile.h"
#include "../src/io/MatrixIO.h"

using namespace neurodecode;
using namespace neurodecode::io;

class MatrixIOTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "neurodecode_matrix_io_test";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        if (std::filesystem::exists(test_dir)) {
            std::filesystem::remove_all(test_dir);
        }
    }

    std::string PathFor(const std::string& name) const {
        return (test_dir / name).string();
    }

    void WriteText(const std::string& filename, const std::string& content) const {
        std::ofstream file(filename);
        file << content;
    }

    static Matrix Sequence(unsigned rows, unsigned cols, double start) {
        Matrix m(rows, cols);
        for (unsigned r = 0; r < rows; ++r) {
            for (unsigned c = 0; c < cols; ++c) {
                m(r, c) = start + r * cols + c + 0.125;
            }
        }
        return m;
    }

    std::filesystem::path test_dir;
};

TEST_F(MatrixIOTest, ExtensionHelpers) {
    EXPECT_TRUE(compat::ends_with("accuracy.ndm", ".ndm"));
    EXPECT_FALSE(compat::ends_with("ndm", ".ndm"));
    EXPECT_EQ(compat::to_lower("Features.NDM"), "features.ndm");
    EXPECT_TRUE(compat::has_extension("Features.NDM.gz", ".ndm"));
    EXPECT_FALSE(compat::has_extension("features.txt", ".ndm"));

    EXPECT_TRUE(MatrixFileReader::IsRecordFile("a/b/result.ndm"));
    EXPECT_TRUE(MatrixFileReader::IsRecordFile("result.ndm.gz"));
    EXPECT_FALSE(MatrixFileReader::IsRecordFile("regressors.txt"));
    EXPECT_TRUE(GzOutputFile::ShouldCompress("out.ndm.GZ"));
    EXPECT_FALSE(GzOutputFile::ShouldCompress("out.ndm"));
}

TEST_F(MatrixIOTest, RecordFileWriteAndRead) {
    const std::string filename = PathFor("records.ndm");

    MatrixFileWriter writer;
    writer.AddRecord("features", Sequence(4, 3, 0.0));
    writer.AddRecord("labels", Sequence(1, 4, 100.0));
    writer.AddRecord("empty", Matrix(0, 5));
    EXPECT_EQ(writer.GetNumberOfRecords(), 3u);
    writer.Write(filename);

    EXPECT_TRUE(std::filesystem::exists(filename));
    EXPECT_FALSE(std::filesystem::exists(filename + ".partial"));

    // Plain files start with the magic bytes
    std::ifstream raw(filename, std::ios::binary);
    char magic[4] = {0};
    raw.read(magic, 4);
    EXPECT_EQ(std::string(magic, 4), "NDM1");

    MatrixFileReader reader(filename);
    ASSERT_EQ(reader.GetRecords().size(), 3u);
    EXPECT_EQ(reader.GetRecords()[0].name, "features");
    EXPECT_TRUE(reader.HasRecord("labels"));
    EXPECT_FALSE(reader.HasRecord("accuracy"));
    EXPECT_EQ(reader.GetRecord("features"), Sequence(4, 3, 0.0));
    EXPECT_EQ(reader.GetRecord("labels"), Sequence(1, 4, 100.0));
    EXPECT_EQ(reader.GetRecord("empty").rows(), 0u);
    EXPECT_EQ(reader.GetRecord("empty").cols(), 5u);
    EXPECT_THROW(reader.GetRecord("accuracy"), DataIOException);
}

TEST_F(MatrixIOTest, CompressedRecordFile) {
    const std::string filename = PathFor("records.ndm.gz");

    MatrixFileWriter writer;
    writer.AddRecord("features", Sequence(20, 10, -50.0));
    writer.Write(filename);

    std::ifstream raw(filename, std::ios::binary);
    unsigned char header[2] = {0, 0};
    raw.read(reinterpret_cast<char*>(header), 2);
    EXPECT_EQ(header[0], 0x1f);
    EXPECT_EQ(header[1], 0x8b);

    Matrix read_back = MatrixFileReader::ReadMatrix(filename, "features");
    EXPECT_EQ(read_back, Sequence(20, 10, -50.0));
}

TEST_F(MatrixIOTest, AddRecordReplacesSameName) {
    MatrixFileWriter writer;
    writer.AddRecord("accuracy", Sequence(1, 1, 0.0));
    writer.AddRecord("accuracy", Sequence(2, 2, 5.0));
    EXPECT_EQ(writer.GetNumberOfRecords(), 1u);

    const std::string filename = PathFor("replaced.ndm");
    writer.Write(filename);
    EXPECT_EQ(MatrixFileReader::ReadMatrix(filename), Sequence(2, 2, 5.0));

    writer.Clear();
    EXPECT_EQ(writer.GetNumberOfRecords(), 0u);
}

TEST_F(MatrixIOTest, CorruptRecordFilesAreFatal) {
    const std::string not_records = PathFor("bogus.ndm");
    WriteText(not_records, "this is not a record file");
    EXPECT_THROW(MatrixFileReader reader(not_records), DataIOException);

    const std::string truncated = PathFor("truncated.ndm");
    MatrixFileWriter writer;
    writer.AddRecord("features", Sequence(8, 8, 0.0));
    writer.Write(truncated);
    std::filesystem::resize_file(truncated, std::filesystem::file_size(truncated) - 12);
    EXPECT_THROW(MatrixFileReader reader(truncated), DataIOException);

    EXPECT_THROW(MatrixFileReader reader(PathFor("missing.ndm")), DataIOException);
}

TEST_F(MatrixIOTest, WriteToMissingDirectoryFails) {
    MatrixFileWriter writer;
    writer.AddRecord("accuracy", Sequence(1, 3, 0.0));
    EXPECT_THROW(writer.Write(PathFor("no/such/dir/out.ndm")), DataIOException);
}

TEST_F(MatrixIOTest, TextMatrixParsing) {
    const std::string filename = PathFor("regressors.txt");
    WriteText(filename,
              "# trial-wise model estimates\n"
              "0.5, 1.0\n"
              "\n"
              "-2  3e-1   # inline comment\n"
              "4;5\n");

    Matrix m = MatrixFileReader::ReadMatrix(filename);
    ASSERT_EQ(m.rows(), 3u);
    ASSERT_EQ(m.cols(), 2u);
    EXPECT_DOUBLE_EQ(m(0, 0), 0.5);
    EXPECT_DOUBLE_EQ(m(1, 0), -2.0);
    EXPECT_DOUBLE_EQ(m(1, 1), 0.3);
    EXPECT_DOUBLE_EQ(m(2, 1), 5.0);
}

TEST_F(MatrixIOTest, MalformedTextMatrixIsRejected) {
    const std::string ragged = PathFor("ragged.txt");
    WriteText(ragged, "1 2 3\n4 5\n");
    EXPECT_THROW(MatrixFileReader::ReadTextMatrix(ragged), DataIOException);

    const std::string words = PathFor("words.txt");
    WriteText(words, "1 two 3\n");
    EXPECT_THROW(MatrixFileReader::ReadTextMatrix(words), DataIOException);

    EXPECT_THROW(MatrixFileReader::ReadTextMatrix(PathFor("missing.txt")), DataIOException);
}

TEST_F(MatrixIOTest, GzFilePrimitives) {
    const std::string filename = PathFor("primitives.bin");
    {
        GzOutputFile out(filename, false);
        out.WriteInt32(-7);
        out.WriteFloat64(2.5);
        out.Write("xy", 2);
        out.Close();
        EXPECT_THROW(out.WriteInt32(1), DataIOException);
    }
    EXPECT_EQ(std::filesystem::file_size(filename), 14u);

    GzInputFile in(filename);
    int32_t value = 0;
    ASSERT_TRUE(in.TryReadInt32(value));
    EXPECT_EQ(value, -7);
    EXPECT_DOUBLE_EQ(in.ReadFloat64("value"), 2.5);

    // Two bytes left: a partial integer is an error, not a clean end
    EXPECT_THROW(in.TryReadInt32(value), DataIOException);
    EXPECT_FALSE(in.TryReadInt32(value));
}
