#include <services/user/MetadataStore.hpp>

#include <services/user/nftTables.hpp>

using namespace UserService;

KvMetadataStore::KvMetadataStore(nftreg::KvStore& kv) : metadataById(kv, NftTables::tokenMetadata)
{
}

void KvMetadataStore::put(const TokenId& tokenId, const TokenMetadata& metadata)
{
   metadataById.put(tokenId, metadata);
}

std::optional<TokenMetadata> KvMetadataStore::get(const TokenId& tokenId) const
{
   return metadataById.get(tokenId);
}

void KvMetadataStore::erase(const TokenId& tokenId)
{
   metadataById.erase(tokenId);
}
