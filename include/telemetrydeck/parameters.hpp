// include/telemetrydeck/parameters.hpp
// Reserved parameter keys recognised by TelemetryDeck dashboards.

#pragma once

namespace telemetrydeck {

// Key under which every signal reports the client library version.
static constexpr const char* CLIENT_VERSION_KEY = "telemetryClientVersion";

// Standard parameter keys, grouped by category.
//
// Example:
//   Params().add(Parameters::Device::PLATFORM, "Linux")
//           .add(Parameters::UserPreferences::LANGUAGE, "en");
struct Parameters {
    struct Accessibility {
        static constexpr const char* FONT_WEIGHT_ADJUSTMENT             = "TelemetryDeck.Accessibility.fontWeightAdjustment";
        static constexpr const char* FONT_SCALE                         = "TelemetryDeck.Accessibility.fontScale";
        static constexpr const char* IS_BOLD_TEXT_ENABLED               = "TelemetryDeck.Accessibility.isBoldTextEnabled";
        static constexpr const char* IS_DARKER_SYSTEM_COLORS_ENABLED    = "TelemetryDeck.Accessibility.isDarkerSystemColorsEnabled";
        static constexpr const char* IS_INVERT_COLORS_ENABLED           = "TelemetryDeck.Accessibility.isInvertColorsEnabled";
        static constexpr const char* IS_REDUCE_MOTION_ENABLED           = "TelemetryDeck.Accessibility.isReduceMotionEnabled";
        static constexpr const char* IS_REDUCE_TRANSPARENCY_ENABLED     = "TelemetryDeck.Accessibility.isReduceTransparencyEnabled";
        static constexpr const char* SHOULD_DIFFERENTIATE_WITHOUT_COLOR = "TelemetryDeck.Accessibility.shouldDifferentiateWithoutColor";
    };

    struct Acquisition {
        static constexpr const char* FIRST_SESSION_DATE = "TelemetryDeck.Acquisition.firstSessionDate";
        static constexpr const char* CHANNEL            = "TelemetryDeck.Acquisition.channel";
        static constexpr const char* LEAD_ID            = "TelemetryDeck.Acquisition.leadID";
    };

    struct Device {
        static constexpr const char* ARCHITECTURE               = "TelemetryDeck.Device.architecture";
        static constexpr const char* MODEL_NAME                 = "TelemetryDeck.Device.modelName";
        static constexpr const char* OPERATING_SYSTEM           = "TelemetryDeck.Device.operatingSystem";
        static constexpr const char* PLATFORM                   = "TelemetryDeck.Device.platform";
        static constexpr const char* SYSTEM_MAJOR_MINOR_VERSION = "TelemetryDeck.Device.systemMajorMinorVersion";
        static constexpr const char* SYSTEM_MAJOR_VERSION       = "TelemetryDeck.Device.systemMajorVersion";
        static constexpr const char* SYSTEM_VERSION             = "TelemetryDeck.Device.systemVersion";
        static constexpr const char* BRAND                      = "TelemetryDeck.Device.brand";
        static constexpr const char* TIME_ZONE                  = "TelemetryDeck.Device.timeZone";
        static constexpr const char* ORIENTATION                = "TelemetryDeck.Device.orientation";
        static constexpr const char* SCREEN_DENSITY             = "TelemetryDeck.Device.screenDensity";
        static constexpr const char* SCREEN_HEIGHT              = "TelemetryDeck.Device.screenResolutionHeight";
        static constexpr const char* SCREEN_WIDTH               = "TelemetryDeck.Device.screenResolutionWidth";
    };

    struct Navigation {
        static constexpr const char* SCHEMA_VERSION   = "TelemetryDeck.Navigation.schemaVersion";
        static constexpr const char* IDENTIFIER       = "TelemetryDeck.Navigation.identifier";
        static constexpr const char* SOURCE_PATH      = "TelemetryDeck.Navigation.sourcePath";
        static constexpr const char* DESTINATION_PATH = "TelemetryDeck.Navigation.destinationPath";
    };

    struct Purchase {
        static constexpr const char* TYPE          = "TelemetryDeck.Purchase.type";
        static constexpr const char* COUNTRY_CODE  = "TelemetryDeck.Purchase.countryCode";
        static constexpr const char* CURRENCY_CODE = "TelemetryDeck.Purchase.currencyCode";
        static constexpr const char* PRODUCT_ID    = "TelemetryDeck.Purchase.productID";
        static constexpr const char* OFFER_ID      = "TelemetryDeck.Purchase.offerID";
        static constexpr const char* PRICE_MICROS  = "TelemetryDeck.Purchase.priceMicros";
    };

    struct Retention {
        static constexpr const char* AVERAGE_SESSION_SECONDS       = "TelemetryDeck.Retention.averageSessionSeconds";
        static constexpr const char* DISTINCT_DAYS_USED            = "TelemetryDeck.Retention.distinctDaysUsed";
        static constexpr const char* TOTAL_SESSIONS_COUNT          = "TelemetryDeck.Retention.totalSessionsCount";
        static constexpr const char* PREVIOUS_SESSION_SECONDS      = "TelemetryDeck.Retention.previousSessionSeconds";
        static constexpr const char* DISTINCT_DAYS_USED_LAST_MONTH = "TelemetryDeck.Retention.distinctDaysUsedLastMonth";
    };

    struct Calendar {
        static constexpr const char* DAY_OF_MONTH    = "TelemetryDeck.Calendar.dayOfMonth";
        static constexpr const char* DAY_OF_WEEK     = "TelemetryDeck.Calendar.dayOfWeek";
        static constexpr const char* DAY_OF_YEAR     = "TelemetryDeck.Calendar.dayOfYear";
        static constexpr const char* WEEK_OF_YEAR    = "TelemetryDeck.Calendar.weekOfYear";
        static constexpr const char* IS_WEEKEND      = "TelemetryDeck.Calendar.isWeekend";
        static constexpr const char* MONTH_OF_YEAR   = "TelemetryDeck.Calendar.monthOfYear";
        static constexpr const char* QUARTER_OF_YEAR = "TelemetryDeck.Calendar.quarterOfYear";
        static constexpr const char* HOUR_OF_DAY     = "TelemetryDeck.Calendar.hourOfDay";
    };

    struct RunContext {
        static constexpr const char* LOCALE             = "TelemetryDeck.RunContext.locale";
        static constexpr const char* TARGET_ENVIRONMENT = "TelemetryDeck.RunContext.targetEnvironment";
        static constexpr const char* IS_SIDE_LOADED     = "TelemetryDeck.RunContext.isSideLoaded";
        static constexpr const char* SOURCE_MARKETPLACE = "TelemetryDeck.RunContext.sourceMarketplace";
    };

    struct UserPreferences {
        static constexpr const char* LAYOUT_DIRECTION = "TelemetryDeck.UserPreference.layoutDirection";
        static constexpr const char* REGION           = "TelemetryDeck.UserPreference.region";
        static constexpr const char* LANGUAGE         = "TelemetryDeck.UserPreference.language";
        static constexpr const char* COLOR_SCHEME     = "TelemetryDeck.UserPreference.colorScheme";
    };
};

} // namespace telemetrydeck
