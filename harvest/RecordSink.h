#ifndef GEOHARVEST_RECORD_SINK_H
#define GEOHARVEST_RECORD_SINK_H

#include "HarvestTypes.h"

#include <string>

/** Export collaborator of the range driver. */
class RecordSink {
 public:
  virtual ~RecordSink() = default;

  /** Persist a non-empty record set under `chunkName`.
    * Throws on failure; the run is aborted. */
  virtual void publish(const RecordSet& records,
                       const std::string& chunkName) = 0;
};

#endif // GEOHARVEST_RECORD_SINK_H
