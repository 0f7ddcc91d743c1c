#include "volume.hpp"
#include "posix_volume.hpp"
#include <core/config.hpp>
#include <core/errors.hpp>

#ifdef RECLOCK_HAVE_GFAPI
#  include "gfapi_volume.hpp"
#endif

std::unique_ptr<Volume> connect_volume(const Config& config) {
    if (!config.uses_gfapi()) {
        return std::make_unique<PosixVolume>(config.volume_name(), config.mount_path());
    }
#ifdef RECLOCK_HAVE_GFAPI
    return std::make_unique<GfapiVolume>(config);
#else
    throw StorageError("reclock-helper was built without libgfapi; "
                       "set mount_path to use a mounted volume");
#endif
}
