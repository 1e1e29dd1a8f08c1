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

/// \file
///

#include "sampling/SamplingEngine.hpp"
#include "sampling/SamplingKey.hpp"

#include "blt_util/parse_util.hpp"
#include "common/Exceptions.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>

namespace wrsample {

std::ostream& operator<<(std::ostream& os, const SamplingSummary& summary)
{
  os << "records read:\t" << summary.recordCount << "\n"
     << "records excluded:\t" << summary.excludedCount << "\n"
     << "records force included:\t" << summary.forcedIncludeCount << "\n"
     << "candidates offered:\t" << summary.offeredCount << "\n"
     << "candidates evicted:\t" << summary.evictedCount << "\n"
     << "records retained:\t" << summary.retainedCount << "\n"
     << "random tie-breaks:\t" << summary.tieBreakCount << "\n";
  return os;
}

static bool isEarlierArrival(const SampleCandidate& a, const SampleCandidate& b)
{
  return (a.arrivalIndex() < b.arrivalIndex());
}

SamplingEngine::SamplingEngine(
    const SamplingOptions& opt, RandomSource& randomSource, SamplingDiagnostics& diagnostics)
  : _opt(opt),
    _randomSource(randomSource),
    _diagnostics(diagnostics),
    _state(EngineState::INIT),
    _filter(opt.includeIds, opt.excludeIds),
    _fieldCount(0),
    _idFieldIndex(0)
{
}

void SamplingEngine::init(const RecordSchema& schema)
{
  using namespace common;

  if (0 == _opt.sampleCount) {
    BOOST_THROW_EXCEPTION(ConfigurationException("Sample count must be greater than zero"));
  }

  if (schema.empty()) {
    BOOST_THROW_EXCEPTION(ConfigurationException("Input record schema has no fields"));
  }
  _fieldCount = schema.size();

  _idFieldIndex = 0;
  if (_opt.idField) {
    _idFieldIndex = schema.resolveField(*_opt.idField, "identifier");
  }

  _weightFieldIndex.reset();
  if (_opt.weightField) {
    _weightFieldIndex = schema.resolveField(*_opt.weightField, "weight");
  }

  for (const std::string& id : _filter.conflictIds()) {
    _diagnostics.identityConflict(id);
  }
}

double SamplingEngine::getWeight(const Record& record) const
{
  if (!_weightFieldIndex) return 1.;

  const std::string& weightStr(record.fields[*_weightFieldIndex]);
  try {
    return blt_util::parse_double_str(weightStr);
  } catch (const common::GeneralException&) {
    std::ostringstream oss;
    oss << "Can't parse sampling weight from value '" << weightStr << "'";
    BOOST_THROW_EXCEPTION(common::WeightException(oss.str()));
  }
}

void SamplingEngine::processRecord(Record& record, BoundedSelector& selector)
{
  using namespace common;

  if (record.fields.size() != _fieldCount) {
    std::ostringstream oss;
    oss << "Record has " << record.fields.size() << " fields, but the input header declares " << _fieldCount;
    BOOST_THROW_EXCEPTION(SchemaException(oss.str()) << ArrivalIndexInfo(record.arrivalIndex));
  }

  const IdentityClass::index_t idClass(_filter.classify(record.fields[_idFieldIndex]));
  if (IdentityClass::EXCLUDED == idClass) {
    _summary.excludedCount++;
    _diagnostics.excluded(record);
    return;
  }

  SampleCandidate candidate;
  if (IdentityClass::FORCED_INCLUDE == idClass) {
    _summary.forcedIncludeCount++;
    _diagnostics.forcedInclude(record);
    candidate.isForcedInclude = true;
    candidate.key             = forcedIncludeSamplingKey();
  } else {
    try {
      candidate.weight     = getWeight(record);
      candidate.randomness = _randomSource.uniform();
      candidate.key        = computeSamplingKey(candidate.weight, candidate.randomness);
    } catch (WeightException& e) {
      // add record context to the in-flight exception:
      e << ArrivalIndexInfo(record.arrivalIndex);
      if (_opt.weightField) e << FieldNameInfo(*_opt.weightField);
      throw;
    }
  }
  candidate.record = std::move(record);

  _summary.offeredCount++;
  if (OfferResult::INSERTED != selector.offer(std::move(candidate))) {
    _summary.evictedCount++;
  }
}

void SamplingEngine::streamRecords(RecordSource& source, BoundedSelector& selector)
{
  uint64_t arrivalIndex(0);
  Record   record;
  while (true) {
    record.clear();
    if (!source.next(record)) break;
    record.arrivalIndex = arrivalIndex++;
    _summary.recordCount++;
    processRecord(record, selector);
  }
}

std::vector<SampleCandidate> SamplingEngine::finalize(BoundedSelector& selector)
{
  std::vector<SampleCandidate> sample(selector.drain());
  std::sort(sample.begin(), sample.end(), isEarlierArrival);
  _summary.retainedCount = sample.size();
  _summary.tieBreakCount = selector.tieBreakCount();
  return sample;
}

void SamplingEngine::emit(
    const RecordSchema& schema, const std::vector<SampleCandidate>& sample, RecordSink& sink)
{
  sink.writeSchema(schema);
  for (const SampleCandidate& candidate : sample) {
    sink.writeRecord(candidate.record);
  }
  sink.flush();
}

SamplingSummary SamplingEngine::run(RecordSource& source, RecordSink& sink)
{
  if (EngineState::INIT != _state) {
    std::ostringstream oss;
    oss << "SamplingEngine::run() called in state '" << EngineState::label(_state)
        << "', each engine performs a single sampling run";
    BOOST_THROW_EXCEPTION(common::PreConditionException(oss.str()));
  }

  try {
    const RecordSchema& schema(source.schema());
    init(schema);

    BoundedSelector selector(_opt.sampleCount, _randomSource, _diagnostics);

    _state = EngineState::STREAMING;
    streamRecords(source, selector);

    _state = EngineState::FINALIZING;
    const std::vector<SampleCandidate> sample(finalize(selector));

    _state = EngineState::DONE;
    emit(schema, sample, sink);
  } catch (...) {
    _state = EngineState::FAILED;
    throw;
  }

  return _summary;
}

}  // namespace wrsample
