#pragma once

// vaxchain: vaccine supply-chain tracking on a versioned record store

#include "vaxchain/chain/config.hpp"
#include "vaxchain/chain/events.hpp"
#include "vaxchain/chain/history.hpp"
#include "vaxchain/identity/identity.hpp"
#include "vaxchain/storage/file_store.hpp"
#include "vaxchain/storage/sqlite_store.hpp"
#include "vaxchain/vaccine_chain.hpp"
