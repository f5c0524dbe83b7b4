#include <unity.h>

#include "logger.hpp"

void test_mac_separators_are_normalized();
void test_invalid_mac_is_rejected();
void test_display_name_prefers_name_then_vendor();
void test_event_kind_names();
void test_unset_timestamp_is_formatted_as_dash();
void test_start_of_day_is_midnight();

void test_network_range_parsing();
void test_arp_table_keeps_complete_entries_in_range();
void test_vendor_database_parsing();
void test_detected_network_is_a_valid_range();

void test_config_defaults();
void test_config_file_is_parsed();
void test_invalid_config_is_rejected();
void test_missing_config_file_gives_defaults();
void test_saved_config_is_read_back();
void test_config_save_fails_on_unusable_path();

void test_upsert_keeps_sticky_fields();
void test_edit_of_unknown_device_fails();
void test_device_lists_ordering();
void test_events_are_listed_newest_first();
void test_failed_event_store_leaves_registry_unchanged();
void test_file_registry_reloads_state();
void test_file_registry_repairs_state_from_event_log();
void test_file_registry_failed_append_leaves_no_partial_line();
void test_file_registry_reset_forgets_everything();
void test_file_registry_open_fails_on_unusable_directory();
void test_field_escaping();

void test_new_device_is_reported_once();
void test_absent_device_leaves_after_ttl();
void test_ttl_boundary_is_inclusive();
void test_returning_device_arrives_and_keeps_user_fields();
void test_duplicate_mac_in_snapshot_is_merged();
void test_changes_are_ordered_by_kind_then_mac();
void test_scan_failure_leaves_registry_untouched();
void test_failed_write_suppresses_only_that_change();
void test_failed_departure_is_retried();
void test_online_devices_are_stored_once_per_cycle();
void test_reset_makes_devices_new_again();
void test_summary_of_who_is_home();

void test_jobs_run_in_order();
void test_stop_waits_for_pending_jobs();
void test_post_requires_running_dispatcher();

void test_quiet_hours_window();
void test_quiet_hours_suppress_everything();
void test_panic_takes_precedence();
void test_notification_texts();
void test_changes_are_delivered_to_every_channel();
void test_panic_replaces_channels();
void test_panic_banner_is_centred();
void test_channels_are_created_from_configuration();

void test_change_formatting();
void test_changes_reach_observers_and_policy();
void test_station_without_policy_only_scans();

void test_html_escape();
void test_status_json_lists_online_devices();
void test_who_json();
void test_device_edit_from_web();
void test_telegram_text();
void test_webhook_payload();

void setUp()
{
}

void tearDown()
{
}

int main()
{
    Logger::instance().setConsoleOutput(false);

    UNITY_BEGIN();

    RUN_TEST(test_mac_separators_are_normalized);
    RUN_TEST(test_invalid_mac_is_rejected);
    RUN_TEST(test_display_name_prefers_name_then_vendor);
    RUN_TEST(test_event_kind_names);
    RUN_TEST(test_unset_timestamp_is_formatted_as_dash);
    RUN_TEST(test_start_of_day_is_midnight);

    RUN_TEST(test_network_range_parsing);
    RUN_TEST(test_arp_table_keeps_complete_entries_in_range);
    RUN_TEST(test_vendor_database_parsing);
    RUN_TEST(test_detected_network_is_a_valid_range);

    RUN_TEST(test_config_defaults);
    RUN_TEST(test_config_file_is_parsed);
    RUN_TEST(test_invalid_config_is_rejected);
    RUN_TEST(test_missing_config_file_gives_defaults);
    RUN_TEST(test_saved_config_is_read_back);
    RUN_TEST(test_config_save_fails_on_unusable_path);

    RUN_TEST(test_upsert_keeps_sticky_fields);
    RUN_TEST(test_edit_of_unknown_device_fails);
    RUN_TEST(test_device_lists_ordering);
    RUN_TEST(test_events_are_listed_newest_first);
    RUN_TEST(test_failed_event_store_leaves_registry_unchanged);
    RUN_TEST(test_file_registry_reloads_state);
    RUN_TEST(test_file_registry_repairs_state_from_event_log);
    RUN_TEST(test_file_registry_failed_append_leaves_no_partial_line);
    RUN_TEST(test_file_registry_reset_forgets_everything);
    RUN_TEST(test_file_registry_open_fails_on_unusable_directory);
    RUN_TEST(test_field_escaping);

    RUN_TEST(test_new_device_is_reported_once);
    RUN_TEST(test_absent_device_leaves_after_ttl);
    RUN_TEST(test_ttl_boundary_is_inclusive);
    RUN_TEST(test_returning_device_arrives_and_keeps_user_fields);
    RUN_TEST(test_duplicate_mac_in_snapshot_is_merged);
    RUN_TEST(test_changes_are_ordered_by_kind_then_mac);
    RUN_TEST(test_scan_failure_leaves_registry_untouched);
    RUN_TEST(test_failed_write_suppresses_only_that_change);
    RUN_TEST(test_failed_departure_is_retried);
    RUN_TEST(test_online_devices_are_stored_once_per_cycle);
    RUN_TEST(test_reset_makes_devices_new_again);
    RUN_TEST(test_summary_of_who_is_home);

    RUN_TEST(test_jobs_run_in_order);
    RUN_TEST(test_stop_waits_for_pending_jobs);
    RUN_TEST(test_post_requires_running_dispatcher);

    RUN_TEST(test_quiet_hours_window);
    RUN_TEST(test_quiet_hours_suppress_everything);
    RUN_TEST(test_panic_takes_precedence);
    RUN_TEST(test_notification_texts);
    RUN_TEST(test_changes_are_delivered_to_every_channel);
    RUN_TEST(test_panic_replaces_channels);
    RUN_TEST(test_panic_banner_is_centred);
    RUN_TEST(test_channels_are_created_from_configuration);

    RUN_TEST(test_change_formatting);
    RUN_TEST(test_changes_reach_observers_and_policy);
    RUN_TEST(test_station_without_policy_only_scans);

    RUN_TEST(test_html_escape);
    RUN_TEST(test_status_json_lists_online_devices);
    RUN_TEST(test_who_json);
    RUN_TEST(test_device_edit_from_web);
    RUN_TEST(test_telegram_text);
    RUN_TEST(test_webhook_payload);

    return UNITY_END();
}
