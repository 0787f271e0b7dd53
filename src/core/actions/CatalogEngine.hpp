#pragma once
#include <memory>

#include "core/actions/ActionEngine.hpp"
#include "core/gather/FileGatherer.hpp"
#include "core/project/Project.hpp"

namespace sdi {

/*
  Engine that records what each action did in the project catalog without
  running the numeric conversion/processing code: containers are created from
  line headers, imports register file names and casts and roll the container
  back to the processing step they invalidate, processing completes it.
*/
ActionEngine makeCatalogEngine(std::shared_ptr<const Project> project,
                               std::shared_ptr<const FileGatherer> gatherer);

} // namespace sdi
