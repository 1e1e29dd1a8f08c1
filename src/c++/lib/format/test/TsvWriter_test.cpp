//
// wrsample - Weighted Random Sampling Tool
// Copyright (c) 2013-2019 Illumina, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.
//
//

#include "boost/test/unit_test.hpp"

#include "format/TsvWriter.hpp"

#include "common/Exceptions.hpp"
#include "test/testFileMakers.hpp"
#include "test/testUtil.hpp"

#include "boost/filesystem.hpp"

BOOST_AUTO_TEST_SUITE(test_TsvWriter)

using namespace wrsample;

static Record makeRecord(const std::vector<std::string>& fields)
{
  Record record;
  record.fields = fields;
  return record;
}

BOOST_AUTO_TEST_CASE(test_TsvWriter_write)
{
  const TestFilenameMaker outputFile;
  {
    OutStream outs(outputFile.getFilename());
    TsvWriter writer(outs);
    writer.writeSchema(RecordSchema({"id", "weight"}));
    writer.writeRecord(makeRecord({"A", "1"}));
    writer.writeRecord(makeRecord({"C", ""}));
    writer.flush();
  }

  BOOST_REQUIRE_EQUAL(getFileContents(outputFile.getFilename()), "id\tweight\nA\t1\nC\t\n");
}

BOOST_AUTO_TEST_CASE(test_TsvWriter_lazyTruncate)
{
  const TestTextFileMaker outputFile("previous content\n");
  {
    // opening without writing leaves the existing file untouched:
    OutStream outs(outputFile.getFilename());
    TsvWriter writer(outs);
  }
  BOOST_REQUIRE_EQUAL(getFileContents(outputFile.getFilename()), "previous content\n");

  {
    OutStream outs(outputFile.getFilename());
    TsvWriter writer(outs);
    writer.writeSchema(RecordSchema({"id"}));
    writer.flush();
  }
  BOOST_REQUIRE_EQUAL(getFileContents(outputFile.getFilename()), "id\n");
}

BOOST_AUTO_TEST_CASE(test_TsvWriter_order)
{
  const TestFilenameMaker outputFile;
  OutStream               outs(outputFile.getFilename());
  TsvWriter               writer(outs);

  BOOST_REQUIRE_THROW(writer.writeRecord(makeRecord({"A"})), common::PreConditionException);
  writer.writeSchema(RecordSchema({"id"}));
  BOOST_REQUIRE_THROW(writer.writeSchema(RecordSchema({"id"})), common::PreConditionException);
}

BOOST_AUTO_TEST_CASE(test_TsvWriter_fieldSeparators)
{
  const TestFilenameMaker outputFile;
  {
    OutStream outs(outputFile.getFilename());
    TsvWriter writer(outs);
    writer.writeSchema(RecordSchema({"id", "note"}));

    // quote characters are written as-is:
    writer.writeRecord(makeRecord({"\"A\"", "x y"}));
    BOOST_REQUIRE_THROW(writer.writeRecord(makeRecord({"B", "x\ty"})), common::GeneralException);
    BOOST_REQUIRE_THROW(writer.writeRecord(makeRecord({"C\n", "z"})), common::GeneralException);
    writer.flush();
  }

  // rejected records leave no partial line behind:
  BOOST_REQUIRE_EQUAL(getFileContents(outputFile.getFilename()), "id\tnote\n\"A\"\tx y\n");
}

BOOST_AUTO_TEST_CASE(test_TsvWriter_unwritableFile)
{
  const TestFilenameMaker outputDir;
  boost::filesystem::create_directory(outputDir.getFilename());

  const std::string outputFile(outputDir.getFilename() + "/missing_dir/sample.tsv");
  BOOST_CHECK_THROW(OutStream{outputFile}, common::GeneralException);

  boost::filesystem::remove(outputDir.getFilename());
}

BOOST_AUTO_TEST_SUITE_END()
