#ifndef TAGGEDFILECACHE_SRC_STORAGE_STORAGE_FACTORY_HPP_
#define TAGGEDFILECACHE_SRC_STORAGE_STORAGE_FACTORY_HPP_

#include "config/config_types.hpp"
#include "storage/i_storage.hpp"
#include "storage/local_storage.hpp"

#include <memory>

namespace TaggedFileCache::Storage
{

class StorageFactory
{
    public:
    //------------------------------------------------------------------------------//
    // Class Creation and Destruction
    //------------------------------------------------------------------------------//
    StorageFactory()                                 = delete;
    StorageFactory(const StorageFactory&)            = delete;
    StorageFactory& operator=(const StorageFactory&) = delete;
    StorageFactory(StorageFactory&&)                 = delete;
    StorageFactory& operator=(StorageFactory&&)      = delete;
    ~StorageFactory()                                = delete;

    //------------------------------------------------------------------------------//
    // Public Methods
    //------------------------------------------------------------------------------//

    /// Builds the storage described by definition and initializes it.
    static StorageResult<std::shared_ptr<IStorage>> Create(
        const Config::StorageDefinition& definition
    )
    {
        std::shared_ptr<IStorage> storage;
        switch (definition.type) {
            case Config::StorageType::Local:
                storage = std::make_shared<LocalStorage>(definition);
                break;
            default:
                return std::unexpected(make_error_code(StorageErrc::NotSupported));
        }

        if (auto init_res = storage->Initialize(); !init_res) {
            return std::unexpected(init_res.error());
        }
        return storage;
    }
};

}  // namespace TaggedFileCache::Storage

#endif  // TAGGEDFILECACHE_SRC_STORAGE_STORAGE_FACTORY_HPP_
