#include "SourceFactory.h"
#include "core/errors.h"
#include "sources/demo/FmSineSource.h"
#include "sources/siglent/SiglentSds.h"

std::unique_ptr<IDataSource> create_source(const LoopConfig& cfg, const boost::asio::any_io_executor& ex) {
    if (cfg.type == "siglent_sds") {
        return std::make_unique<SiglentSds>(ex, cfg.host, cfg.port, cfg.channels,
                                            cfg.pacing_factor, cfg.divisions);
    }
    if (cfg.type == "fm_sine") {
        return std::make_unique<FmSineSource>();
    }
    throw ConfigurationError("no data source for type: " + cfg.type + " (id=" + cfg.id + ")");
}
