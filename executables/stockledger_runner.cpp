#include <inttypes.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "retail/include/config.hpp"
#include "retail/include/initializer.hpp"
#include "retail/include/inventory_engine.hpp"
#include "retail/include/retail_tables.hpp"
#include "retail/include/tx_runner.hpp"
#include "retail/include/tx_utils.hpp"
#include "utils/date.hpp"
#include "utils/logger.hpp"
#include "utils/utils.hpp"

struct ThreadLocalData {
    alignas(64) Quantity sold = 0;
    Quantity delivered = 0;
    size_t sale_lines = 0;
    size_t rejected_lines = 0;
    size_t deliveries = 0;
};

void run_mix(
    int* flag, ThreadLocalData& t_data, RetailTables& t, InventoryEngine& engine,
    uint32_t num_stores, uint32_t num_products, Date d) {
    while (__atomic_load_n(flag, __ATOMIC_ACQUIRE)) {
        StoreID store_id = urand_int(1, num_stores);
        ProductID product_id = urand_int(1, num_products);

        int x = urand_int(1, 100);
        if (x <= 80) {
            SaleLine line{t.open_sale(store_id, d), product_id, static_cast<Quantity>(urand_int(1, 10))};
            CommitResult r = t.capture_sale_line(engine, line);
            if (r.applied) {
                t_data.sold += line.quantity;
                t_data.sale_lines++;
            } else {
                t_data.rejected_lines++;
            }
        } else {
            Delivery delivery;
            delivery.delivery_id = t.next_delivery_id();
            delivery.store_id = store_id;
            delivery.product_id = product_id;
            delivery.quantity = urand_int(10, 100);
            delivery.vendor_id = urand_int(1, Initializer::VENDORS);
            delivery.delivery_date = d;
            ReceiveResult r = t.receive_delivery(engine, delivery);
            if (r.kind != ReceiveResult::REJECTED) {
                t_data.delivered += delivery.quantity;
                t_data.deliveries++;
            }
        }
    }
}

Quantity total_stock(InventoryEngine& engine, bool& negative_found) {
    Quantity total = 0;
    engine.get_ledger().for_each_row([&](const InventoryRow& row) {
        if (row.quantity < 0) {
            negative_found = true;
            row.print();
        }
        total += row.quantity;
    });
    return total;
}

int main(int argc, const char* argv[]) {
    if (argc != 5) {
        printf("num_stores num_products num_threads seconds\n");
        exit(1);
    }

    uint32_t num_stores = static_cast<uint32_t>(std::stoul(argv[1], nullptr, 10));
    uint32_t num_products = static_cast<uint32_t>(std::stoul(argv[2], nullptr, 10));
    int num_threads = std::stoi(argv[3], nullptr, 10);
    int seconds = std::stoi(argv[4], nullptr, 10);

    if (num_stores == 0 || num_products == 0 || num_threads <= 0 || seconds <= 0) {
        printf("all arguments must be positive\n");
        exit(1);
    }

    Config& c = get_mutable_config();
    c.set_num_threads(num_threads);
    std::set<StoreID> reporting;
    for (StoreID s = 1; s <= num_stores; s++) reporting.insert(s);
    c.set_reporting_stores(reporting);

    Date d = today();
    CalendarDate cd = to_calendar_date(d);

    RetailTables t;
    InventoryEngine engine(t.get_collaborators());

    printf("Loading %" PRIu32 " store(s) x %" PRIu32 " product(s)\n", num_stores, num_products);
    Initializer::load_all_tables(t, engine, num_stores, num_products, d);
    bool negative_found = false;
    Quantity opening = total_stock(engine, negative_found);
    printf("Loaded, %" PRId64 " unit(s) on hand\n", opening);

    std::vector<std::thread> threads;
    threads.reserve(num_threads);

    alignas(64) int flag = 1;

    std::vector<ThreadLocalData> t_data(num_threads);

    for (int i = 0; i < num_threads; i++) {
        threads.emplace_back(
            run_mix, &flag, std::ref(t_data[i]), std::ref(t), std::ref(engine), num_stores,
            num_products, d);
    }

    std::this_thread::sleep_for(std::chrono::seconds(seconds));

    __atomic_store_n(&flag, 0, __ATOMIC_RELEASE);

    for (int i = 0; i < num_threads; i++) {
        threads[i].join();
    }

    ThreadLocalData sum;
    for (int i = 0; i < num_threads; i++) {
        sum.sold += t_data[i].sold;
        sum.delivered += t_data[i].delivered;
        sum.sale_lines += t_data[i].sale_lines;
        sum.rejected_lines += t_data[i].rejected_lines;
        sum.deliveries += t_data[i].deliveries;
    }

    Quantity closing = total_stock(engine, negative_found);
    Quantity expected = opening + sum.delivered - sum.sold;

    ProfitabilityAggregator::RunReport report = engine.recompute(cd.year, cd.month);

    Stat stat = engine.get_stat();
    Stat::PerTxType total = stat.aggregate_perf();

    printf("%u store(s), %u product(s), %d thread(s), %d second(s)\n", num_stores, num_products,
        num_threads, seconds);
    printf("    commits: %lu\n", total.num_commits);
    printf("    usr_aborts: %lu\n", total.num_usr_aborts);
    printf("    sys_aborts: %lu\n", total.num_sys_aborts);
    printf("    gave_up: %lu\n", total.num_gave_up);
    printf("    listener_failures: %lu\n", stat.num_listener_failures);
    printf("Throughput: %lu txns/s\n", total.num_commits / seconds);
    printf(
        "Sale lines: %lu applied, %lu rejected. Deliveries: %lu\n", sum.sale_lines,
        sum.rejected_lines, sum.deliveries);
    printf("Open alerts: %lu\n", engine.open_alerts().size());

    printf("\nDetails:\n");
    constexpr_for<TxProfileID::MAX>([&](auto i) {
        constexpr auto p = static_cast<TxProfileID>(i.value);
        using Profile = TxProfile<p>;
        double tries = stat[p].num_commits + stat[p].num_usr_aborts + stat[p].num_sys_aborts;
        if (tries == 0) tries = 1;
        printf(
            "    %-16s c:%10lu(%.2f%%)   ua:%10lu(%.2f%%)  sa:%10lu(%.2f%%)\n", Profile::name,
            stat[p].num_commits, stat[p].num_commits / tries * 100, stat[p].num_usr_aborts,
            stat[p].num_usr_aborts / tries * 100, stat[p].num_sys_aborts,
            stat[p].num_sys_aborts / tries * 100);
    });

    printf("\nSystem Abort Details:\n");
    constexpr_for<TxProfileID::MAX>([&](auto i) {
        constexpr auto p = static_cast<TxProfileID>(i.value);
        using Profile = TxProfile<p>;
        printf("    %-16s\n", Profile::name);
        for (uint8_t a = 0; a < Profile::AbortID::MAX; a++) {
            printf(
                "        %-45s: %lu\n",
                Profile::abort_reason(static_cast<typename Profile::AbortID>(a)),
                stat[p].abort_details[a]);
        }
    });

    printf("\nProfitability %04d-%02u:\n", cd.year, cd.month);
    for (StoreID s: c.get_reporting_stores()) {
        std::optional<StoreProfitability> row = engine.profitability(cd.year, cd.month, s);
        if (!row) continue;
        printf(
            "    store %-6" PRIu32 " revenue:%14" PRId64 "  expense:%14" PRId64 "  net:%14" PRId64
            "\n",
            s, row->total_revenue, row->total_expense, row->net_profit);
    }
    if (!report.failed_stores.empty()) {
        printf("    %lu store(s) failed\n", report.failed_stores.size());
    }

    printf("\nInvariant: stock %" PRId64 ", expected %" PRId64 ", negative rows: %s\n", closing,
        expected, negative_found ? "yes" : "no");
    if (negative_found || closing != expected) {
        LOG_ERROR("ledger invariant violated (stock %" PRId64 ", expected %" PRId64 ")", closing,
            expected);
        return 1;
    }
    return 0;
}
