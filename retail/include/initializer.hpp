#pragma once

#include <cstdint>

#include "retail/include/inventory_engine.hpp"
#include "retail/include/record_layout.hpp"
#include "retail/include/retail_tables.hpp"
#include "utils/date.hpp"

namespace Initializer {
static const uint32_t VENDORS = 4;
static const Quantity MIN_OPENING_STOCK = 50;
static const Quantity MAX_OPENING_STOCK = 500;

void load_products_table(RetailTables& t, uint32_t num_products);
void load_vendor_prices_table(RetailTables& t, uint32_t num_products);
void load_expenses_table(RetailTables& t, uint32_t num_stores, Date d);
// Every (store, product) pair receives one opening delivery through the accumulator.
void load_opening_stock(
    RetailTables& t, InventoryEngine& engine, uint32_t num_stores, uint32_t num_products, Date d);

void load_all_tables(
    RetailTables& t, InventoryEngine& engine, uint32_t num_stores, uint32_t num_products, Date d);
}  // namespace Initializer
