#include "pwf/Schema.hpp"

#include <stdexcept>

namespace pwf {

namespace {

const char* const kPlanSchemaV1 = R"json({
  "$schema": "https://json-schema.org/draft/2020-12/schema",
  "$id": "https://pwf.dev/schema/pwf-v1.json",
  "title": "PWF Plan v1",
  "type": "object",
  "required": ["plan_version", "cycle"],
  "additionalProperties": false,
  "properties": {
    "plan_version": { "type": "integer", "const": 1 },
    "meta": { "$ref": "#/$defs/Meta" },
    "glossary": {
      "type": "object",
      "additionalProperties": { "type": "string" }
    },
    "cycle": { "$ref": "#/$defs/Cycle" }
  },
  "$defs": {
    "Meta": {
      "type": "object",
      "required": ["title"],
      "additionalProperties": false,
      "properties": {
        "id": { "type": "string" },
        "title": { "type": "string", "minLength": 1, "maxLength": 80 },
        "description": { "type": "string" },
        "author": { "type": "string" },
        "status": { "type": "string", "enum": ["draft", "active", "completed", "archived"] },
        "activated_at": { "type": "string", "format": "date-time" },
        "completed_at": { "type": "string", "format": "date-time" },
        "equipment": { "type": "array", "items": { "type": "string" } },
        "daysPerWeek": { "type": "integer", "minimum": 1, "maximum": 7 },
        "recommendedFirst": { "type": "boolean" },
        "tags": { "type": "array", "items": { "type": "string" } },
        "athlete_profile": { "$ref": "#/$defs/AthleteProfile" }
      }
    },
    "AthleteProfile": {
      "type": "object",
      "additionalProperties": false,
      "properties": {
        "ftp_watts": { "type": "number", "exclusiveMinimum": 0 },
        "threshold_hr_bpm": { "type": "integer", "minimum": 30, "maximum": 250 },
        "max_hr_bpm": { "type": "integer", "minimum": 30, "maximum": 250 },
        "threshold_pace_sec_per_km": { "type": "number", "exclusiveMinimum": 0 },
        "weight_kg": { "type": "number", "exclusiveMinimum": 0 }
      }
    },
    "Cycle": {
      "type": "object",
      "required": ["days"],
      "additionalProperties": false,
      "properties": {
        "start_date": { "type": "string", "format": "date" },
        "notes": { "type": "string" },
        "days": { "type": "array", "minItems": 1, "items": { "$ref": "#/$defs/Day" } }
      }
    },
    "Day": {
      "type": "object",
      "required": ["exercises"],
      "additionalProperties": false,
      "properties": {
        "id": { "type": "string" },
        "order": { "type": "integer", "minimum": 0 },
        "focus": { "type": "string" },
        "notes": { "type": "string" },
        "scheduled_date": { "type": "string", "format": "date" },
        "target_session_length_min": { "type": "integer", "minimum": 1 },
        "exercises": { "type": "array", "minItems": 1, "items": { "$ref": "#/$defs/Exercise" } }
      }
    },
    "Exercise": {
      "type": "object",
      "required": ["modality"],
      "additionalProperties": false,
      "dependentRequired": {
        "target_weight_percent": ["percent_of"],
        "percent_of": ["target_weight_percent"]
      },
      "properties": {
        "id": { "type": "string" },
        "name": { "type": "string" },
        "modality": {
          "type": "string",
          "enum": ["strength", "countdown", "stopwatch", "interval", "cycling", "running", "rowing", "swimming"]
        },
        "target_sets": { "type": "integer", "minimum": 1 },
        "target_reps": { "type": "integer", "minimum": 1 },
        "target_duration_sec": { "type": "integer", "minimum": 1 },
        "target_distance_meters": { "type": "number", "exclusiveMinimum": 0 },
        "target_load": { "type": "string" },
        "target_weight_percent": { "type": "number", "exclusiveMinimum": 0, "maximum": 200 },
        "percent_of": { "type": "string", "enum": ["1rm", "3rm", "5rm", "10rm"] },
        "reference_exercise": { "type": "string" },
        "cues": { "type": "string" },
        "target_notes": { "type": "string" },
        "link": { "type": "string", "pattern": "^https://" },
        "image": { "type": "string", "pattern": "^https://" },
        "group": { "type": "string", "pattern": "^[A-Za-z0-9_-]+$" },
        "group_type": { "type": "string", "enum": ["superset", "circuit"] },
        "rest_between_sets_sec": { "type": "integer", "minimum": 0 },
        "rest_after_sec": { "type": "integer", "minimum": 0 },
        "zones": { "type": "array", "minItems": 1, "items": { "$ref": "#/$defs/TrainingZone" } },
        "ramp": { "$ref": "#/$defs/RampConfig" },
        "interval_phases": { "type": "array", "minItems": 1, "items": { "$ref": "#/$defs/IntervalPhase" } }
      }
    },
    "TrainingZone": {
      "type": "object",
      "required": ["zone"],
      "additionalProperties": false,
      "properties": {
        "zone": { "type": "integer", "minimum": 1, "maximum": 7 },
        "duration_sec": { "type": "integer", "minimum": 1 },
        "target_power_watts": { "type": "number", "minimum": 0 },
        "target_hr_bpm": { "type": "integer", "minimum": 30, "maximum": 250 },
        "target_pace_sec_per_km": { "type": "number", "exclusiveMinimum": 0 }
      }
    },
    "RampConfig": {
      "type": "object",
      "required": ["start_power_watts", "end_power_watts", "duration_sec"],
      "additionalProperties": false,
      "properties": {
        "start_power_watts": { "type": "number", "minimum": 0 },
        "end_power_watts": { "type": "number", "minimum": 0 },
        "duration_sec": { "type": "integer", "minimum": 1 },
        "step_duration_sec": { "type": "integer", "minimum": 1 }
      }
    },
    "IntervalPhase": {
      "type": "object",
      "required": ["name", "duration_sec"],
      "additionalProperties": false,
      "properties": {
        "name": { "type": "string", "minLength": 1 },
        "duration_sec": { "type": "integer", "minimum": 1 },
        "target_power_watts": { "type": "number", "minimum": 0 },
        "target_hr_bpm": { "type": "integer", "minimum": 30, "maximum": 250 },
        "target_pace_sec_per_km": { "type": "number", "exclusiveMinimum": 0 },
        "cadence_rpm": { "type": "number", "minimum": 0 }
      }
    }
  }
})json";

const char* const kHistorySchemaV1 = R"json({
  "$schema": "https://json-schema.org/draft/2020-12/schema",
  "$id": "https://pwf.dev/schema/pwf-history-v1.json",
  "title": "PWF History Export v1",
  "type": "object",
  "required": ["history_version", "exported_at", "workouts"],
  "additionalProperties": false,
  "properties": {
    "history_version": { "type": "integer", "const": 1 },
    "exported_at": { "type": "string", "format": "date-time" },
    "export_source": { "$ref": "#/$defs/ExportSource" },
    "units": { "$ref": "#/$defs/Units" },
    "workouts": { "type": "array", "items": { "$ref": "#/$defs/Workout" } },
    "personal_records": { "type": "array", "items": { "$ref": "#/$defs/PersonalRecord" } },
    "body_measurements": { "type": "array", "items": { "$ref": "#/$defs/BodyMeasurement" } }
  },
  "$defs": {
    "Sport": {
      "type": "string",
      "enum": ["swimming", "cycling", "running", "rowing", "transition", "strength", "strength-training",
               "hiking", "walking", "yoga", "pilates", "functional-fitness", "calisthenics", "cardio",
               "cross-country-skiing", "downhill-skiing", "snowboarding", "stand-up-paddling", "kayaking",
               "elliptical", "stair-climbing", "other"]
    },
    "StrokeType": {
      "type": "string",
      "enum": ["freestyle", "backstroke", "breaststroke", "butterfly", "drill", "mixed", "im"]
    },
    "Units": {
      "type": "object",
      "additionalProperties": false,
      "properties": {
        "weight": { "type": "string", "enum": ["kg", "lb"] },
        "distance": { "type": "string", "enum": ["meters", "kilometers", "miles", "feet", "yards"] }
      }
    },
    "ExportSource": {
      "type": "object",
      "additionalProperties": false,
      "properties": {
        "app_name": { "type": "string" },
        "app_version": { "type": "string" },
        "platform": { "type": "string", "enum": ["ios", "android", "web", "desktop"] },
        "preferred_units": { "$ref": "#/$defs/Units" }
      }
    },
    "Workout": {
      "type": "object",
      "required": ["date", "exercises"],
      "additionalProperties": false,
      "properties": {
        "id": { "type": "string" },
        "date": { "type": "string", "format": "date" },
        "started_at": { "type": "string", "format": "date-time" },
        "ended_at": { "type": "string", "format": "date-time" },
        "duration_sec": { "type": "integer", "minimum": 0 },
        "title": { "type": "string" },
        "notes": { "type": "string" },
        "plan_id": { "type": "string" },
        "plan_day_id": { "type": "string" },
        "exercises": { "type": "array", "minItems": 1, "items": { "$ref": "#/$defs/CompletedExercise" } },
        "telemetry": { "$ref": "#/$defs/WorkoutTelemetry" },
        "devices": { "type": "array", "items": { "$ref": "#/$defs/DeviceInfo" } },
        "sport": { "$ref": "#/$defs/Sport" },
        "sport_segments": { "type": "array", "items": { "$ref": "#/$defs/SportSegment" } }
      }
    },
    "CompletedExercise": {
      "type": "object",
      "required": ["name", "sets"],
      "additionalProperties": false,
      "properties": {
        "id": { "type": "string" },
        "name": { "type": "string", "minLength": 1 },
        "modality": { "type": "string", "enum": ["strength", "countdown", "stopwatch", "interval", "swimming"] },
        "notes": { "type": "string" },
        "sets": { "type": "array", "minItems": 1, "items": { "$ref": "#/$defs/CompletedSet" } },
        "pool_config": { "$ref": "#/$defs/PoolConfig" },
        "sport": { "$ref": "#/$defs/Sport" }
      }
    },
    "CompletedSet": {
      "type": "object",
      "additionalProperties": false,
      "properties": {
        "set_number": { "type": "integer", "minimum": 1 },
        "set_type": { "type": "string", "enum": ["working", "warmup", "dropset", "failure", "amrap"] },
        "reps": { "type": "integer", "minimum": 0 },
        "weight_kg": { "type": "number", "minimum": 0 },
        "weight_lb": { "type": "number", "minimum": 0 },
        "duration_sec": { "type": "integer", "minimum": 0 },
        "distance_meters": { "type": "number", "minimum": 0 },
        "rpe": { "type": "number", "minimum": 0, "maximum": 10 },
        "rir": { "type": "integer", "minimum": 0 },
        "notes": { "type": "string" },
        "is_pr": { "type": "boolean" },
        "completed_at": { "type": "string", "format": "date-time" },
        "telemetry": { "$ref": "#/$defs/SetTelemetry" },
        "swimming": { "$ref": "#/$defs/SwimmingSetData" }
      }
    },
    "SetTelemetry": {
      "type": "object",
      "additionalProperties": false,
      "properties": {
        "heart_rate_avg": { "type": "integer", "minimum": 0 },
        "heart_rate_max": { "type": "integer", "minimum": 0 },
        "heart_rate_min": { "type": "integer", "minimum": 0 },
        "power_avg": { "type": "integer", "minimum": 0 },
        "power_max": { "type": "integer", "minimum": 0 },
        "power_min": { "type": "integer", "minimum": 0 },
        "elevation_gain_m": { "type": "number", "minimum": 0 },
        "elevation_gain_ft": { "type": "number", "minimum": 0 },
        "elevation_loss_m": { "type": "number", "minimum": 0 },
        "elevation_loss_ft": { "type": "number", "minimum": 0 },
        "speed_avg_mps": { "type": "number", "minimum": 0 },
        "speed_avg_kph": { "type": "number", "minimum": 0 },
        "speed_avg_mph": { "type": "number", "minimum": 0 },
        "speed_max_mps": { "type": "number", "minimum": 0 },
        "speed_max_kph": { "type": "number", "minimum": 0 },
        "speed_max_mph": { "type": "number", "minimum": 0 },
        "pace_avg_sec_per_km": { "type": "number", "minimum": 0 },
        "pace_avg_sec_per_mi": { "type": "number", "minimum": 0 },
        "cadence_avg": { "type": "number", "minimum": 0 },
        "cadence_max": { "type": "number", "minimum": 0 },
        "temperature_c": { "type": "number" },
        "temperature_f": { "type": "number" },
        "humidity_percent": { "type": "number", "minimum": 0, "maximum": 100 },
        "calories": { "type": "integer", "minimum": 0 },
        "stroke_rate": { "type": "number", "minimum": 0 },
        "gps_route_id": { "type": "string" },
        "time_series": { "$ref": "#/$defs/TimeSeriesData" }
      }
    },
    "NumberSeries": { "type": "array", "items": { "type": "number" } },
    "TimeSeriesData": {
      "type": "object",
      "required": ["timestamps"],
      "additionalProperties": false,
      "properties": {
        "timestamps": { "type": "array", "items": { "type": "string", "format": "date-time" } },
        "elapsed_sec": { "$ref": "#/$defs/NumberSeries" },
        "heart_rate": { "$ref": "#/$defs/NumberSeries" },
        "power": { "$ref": "#/$defs/NumberSeries" },
        "cadence": { "$ref": "#/$defs/NumberSeries" },
        "speed_mps": { "$ref": "#/$defs/NumberSeries" },
        "distance_m": { "$ref": "#/$defs/NumberSeries" },
        "elevation_m": { "$ref": "#/$defs/NumberSeries" },
        "temperature_c": { "$ref": "#/$defs/NumberSeries" },
        "latitude": { "$ref": "#/$defs/NumberSeries" },
        "longitude": { "$ref": "#/$defs/NumberSeries" },
        "grade_percent": { "$ref": "#/$defs/NumberSeries" },
        "respiration_rate": { "$ref": "#/$defs/NumberSeries" },
        "core_temperature_c": { "$ref": "#/$defs/NumberSeries" },
        "muscle_oxygen_percent": { "$ref": "#/$defs/NumberSeries" },
        "power_balance": { "$ref": "#/$defs/NumberSeries" },
        "left_pedal_smoothness": { "$ref": "#/$defs/NumberSeries" },
        "right_pedal_smoothness": { "$ref": "#/$defs/NumberSeries" },
        "left_torque_effectiveness": { "$ref": "#/$defs/NumberSeries" },
        "right_torque_effectiveness": { "$ref": "#/$defs/NumberSeries" },
        "stride_length_m": { "$ref": "#/$defs/NumberSeries" },
        "vertical_oscillation_cm": { "$ref": "#/$defs/NumberSeries" },
        "ground_contact_time_ms": { "$ref": "#/$defs/NumberSeries" },
        "ground_contact_balance": { "$ref": "#/$defs/NumberSeries" },
        "stroke_rate": { "$ref": "#/$defs/NumberSeries" },
        "stroke_count": { "$ref": "#/$defs/NumberSeries" },
        "swolf": { "$ref": "#/$defs/NumberSeries" },
        "stroke_type": { "type": "array", "items": { "$ref": "#/$defs/StrokeType" } }
      }
    },
    "SwimmingSetData": {
      "type": "object",
      "additionalProperties": false,
      "properties": {
        "lengths": { "type": "array", "items": { "$ref": "#/$defs/SwimmingLength" } },
        "stroke_type": { "$ref": "#/$defs/StrokeType" },
        "total_lengths": { "type": "integer", "minimum": 0 },
        "active_lengths": { "type": "integer", "minimum": 0 },
        "swolf_avg": { "type": "number", "minimum": 0 },
        "drill_mode": { "type": "boolean" }
      }
    },
    "SwimmingLength": {
      "type": "object",
      "required": ["length_number", "stroke_type", "duration_sec"],
      "additionalProperties": false,
      "properties": {
        "length_number": { "type": "integer", "minimum": 1 },
        "stroke_type": { "$ref": "#/$defs/StrokeType" },
        "duration_sec": { "type": "number", "minimum": 0 },
        "stroke_count": { "type": "integer", "minimum": 0 },
        "swolf": { "type": "integer", "minimum": 0 },
        "started_at": { "type": "string", "format": "date-time" },
        "active": { "type": "boolean" }
      }
    },
    "PoolConfig": {
      "type": "object",
      "required": ["pool_length"],
      "additionalProperties": false,
      "properties": {
        "pool_length": { "type": "number", "exclusiveMinimum": 0 },
        "pool_length_unit": { "type": "string", "enum": ["meters", "yards"] }
      }
    },
    "WorkoutTelemetry": {
      "type": "object",
      "additionalProperties": false,
      "properties": {
        "heart_rate_avg": { "type": "integer", "minimum": 0 },
        "heart_rate_max": { "type": "integer", "minimum": 0 },
        "heart_rate_min": { "type": "integer", "minimum": 0 },
        "power_avg": { "type": "integer", "minimum": 0 },
        "power_max": { "type": "integer", "minimum": 0 },
        "total_distance_m": { "type": "number", "minimum": 0 },
        "total_distance_km": { "type": "number", "minimum": 0 },
        "total_distance_mi": { "type": "number", "minimum": 0 },
        "total_elevation_gain_m": { "type": "number", "minimum": 0 },
        "total_elevation_gain_ft": { "type": "number", "minimum": 0 },
        "total_elevation_loss_m": { "type": "number", "minimum": 0 },
        "total_elevation_loss_ft": { "type": "number", "minimum": 0 },
        "speed_avg_kph": { "type": "number", "minimum": 0 },
        "speed_avg_mph": { "type": "number", "minimum": 0 },
        "speed_max_kph": { "type": "number", "minimum": 0 },
        "speed_max_mph": { "type": "number", "minimum": 0 },
        "pace_avg_sec_per_km": { "type": "number", "minimum": 0 },
        "pace_avg_sec_per_mi": { "type": "number", "minimum": 0 },
        "cadence_avg": { "type": "number", "minimum": 0 },
        "temperature_c": { "type": "number" },
        "temperature_f": { "type": "number" },
        "humidity_percent": { "type": "number", "minimum": 0, "maximum": 100 },
        "total_calories": { "type": "integer", "minimum": 0 },
        "gps_route_id": { "type": "string" },
        "gps_route": { "$ref": "#/$defs/GpsRoute" },
        "advanced_metrics": { "$ref": "#/$defs/AdvancedMetrics" },
        "power_metrics": { "$ref": "#/$defs/PowerMetrics" },
        "time_in_zones": { "$ref": "#/$defs/TimeInZones" }
      }
    },
    "GpsRoute": {
      "type": "object",
      "required": ["route_id", "positions"],
      "additionalProperties": false,
      "properties": {
        "route_id": { "type": "string" },
        "name": { "type": "string" },
        "positions": { "type": "array", "items": { "$ref": "#/$defs/GpsPosition" } },
        "total_distance_m": { "type": "number", "minimum": 0 },
        "total_ascent_m": { "type": "number", "minimum": 0 },
        "total_descent_m": { "type": "number", "minimum": 0 },
        "min_elevation_m": { "type": "number" },
        "max_elevation_m": { "type": "number" },
        "bbox_sw_lat": { "type": "number", "minimum": -90, "maximum": 90 },
        "bbox_sw_lng": { "type": "number", "minimum": -180, "maximum": 180 },
        "bbox_ne_lat": { "type": "number", "minimum": -90, "maximum": 90 },
        "bbox_ne_lng": { "type": "number", "minimum": -180, "maximum": 180 },
        "recording_mode": { "type": "string" },
        "gps_fix": { "type": "string", "enum": ["none", "fix_2d", "fix_3d", "dgps", "unknown"] }
      }
    },
    "GpsPosition": {
      "type": "object",
      "required": ["latitude_deg", "longitude_deg", "timestamp"],
      "additionalProperties": false,
      "properties": {
        "latitude_deg": { "type": "number", "minimum": -90, "maximum": 90 },
        "longitude_deg": { "type": "number", "minimum": -180, "maximum": 180 },
        "timestamp": { "type": "string", "format": "date-time" },
        "elevation_m": { "type": "number" },
        "accuracy_m": { "type": "number", "minimum": 0 },
        "speed_mps": { "type": "number", "minimum": 0 },
        "heading_deg": { "type": "number", "minimum": 0, "maximum": 360 },
        "heart_rate_bpm": { "type": "integer", "minimum": 0 },
        "power_watts": { "type": "integer", "minimum": 0 },
        "cadence": { "type": "integer", "minimum": 0 },
        "temperature_c": { "type": "number" }
      }
    },
    "AdvancedMetrics": {
      "type": "object",
      "additionalProperties": false,
      "properties": {
        "training_effect": { "type": "number", "minimum": 0, "maximum": 5 },
        "anaerobic_training_effect": { "type": "number", "minimum": 0, "maximum": 5 },
        "recovery_time_hours": { "type": "number", "minimum": 0 },
        "vo2_max_estimate": { "type": "number", "minimum": 0 },
        "lactate_threshold": { "$ref": "#/$defs/LactateThreshold" },
        "performance_condition": { "type": "number" },
        "training_load": { "type": "number", "minimum": 0 },
        "training_status": {
          "type": "string",
          "enum": ["detraining", "recovery", "maintaining", "productive", "peaking", "overreaching", "unknown"]
        }
      }
    },
    "LactateThreshold": {
      "type": "object",
      "additionalProperties": false,
      "properties": {
        "heart_rate_bpm": { "type": "integer", "minimum": 0 },
        "speed_mps": { "type": "number", "minimum": 0 },
        "power_watts": { "type": "integer", "minimum": 0 },
        "detected_at": { "type": "string", "format": "date-time" }
      }
    },
    "PowerMetrics": {
      "type": "object",
      "additionalProperties": false,
      "properties": {
        "normalized_power": { "type": "number", "minimum": 0 },
        "training_stress_score": { "type": "number", "minimum": 0 },
        "intensity_factor": { "type": "number", "minimum": 0 },
        "variability_index": { "type": "number", "minimum": 0 },
        "ftp_watts": { "type": "number", "minimum": 0 },
        "total_work_kj": { "type": "number", "minimum": 0 },
        "left_right_balance": { "type": "number", "minimum": 0, "maximum": 100 },
        "left_pedal_smoothness": { "type": "number", "minimum": 0, "maximum": 100 },
        "right_pedal_smoothness": { "type": "number", "minimum": 0, "maximum": 100 },
        "left_torque_effectiveness": { "type": "number", "minimum": 0, "maximum": 100 },
        "right_torque_effectiveness": { "type": "number", "minimum": 0, "maximum": 100 }
      }
    },
    "TimeInZones": {
      "type": "object",
      "additionalProperties": false,
      "properties": {
        "hr_zones_sec": { "$ref": "#/$defs/NumberSeries" },
        "power_zones_sec": { "$ref": "#/$defs/NumberSeries" },
        "hr_zone_boundaries": { "$ref": "#/$defs/NumberSeries" },
        "power_zone_boundaries": { "$ref": "#/$defs/NumberSeries" },
        "pace_zones_sec": { "$ref": "#/$defs/NumberSeries" },
        "pace_zone_boundaries": { "$ref": "#/$defs/NumberSeries" }
      }
    },
    "DeviceInfo": {
      "type": "object",
      "required": ["device_type", "manufacturer"],
      "additionalProperties": false,
      "properties": {
        "device_index": { "type": "integer", "minimum": 0 },
        "device_type": {
          "type": "string",
          "enum": ["watch", "bike_computer", "heart_rate_monitor", "power_meter", "speed_sensor", "cadence_sensor",
                   "speed_cadence_sensor", "foot_pod", "smart_trainer", "camera", "phone", "other"]
        },
        "manufacturer": { "type": "string" },
        "product": { "type": "string" },
        "serial_number": { "type": "string" },
        "software_version": { "type": "string" },
        "hardware_version": { "type": "string" },
        "battery": { "$ref": "#/$defs/BatteryInfo" },
        "cumulative_operating_time_hours": { "type": "number", "minimum": 0 },
        "connection": { "$ref": "#/$defs/ConnectionInfo" },
        "calibration": { "$ref": "#/$defs/CalibrationInfo" }
      }
    },
    "BatteryInfo": {
      "type": "object",
      "additionalProperties": false,
      "properties": {
        "start_percent": { "type": "number", "minimum": 0, "maximum": 100 },
        "end_percent": { "type": "number", "minimum": 0, "maximum": 100 },
        "voltage": { "type": "number", "minimum": 0 },
        "status": { "type": "string", "enum": ["good", "low", "critical", "charging", "unknown"] }
      }
    },
    "ConnectionInfo": {
      "type": "object",
      "required": ["connection_type"],
      "additionalProperties": false,
      "properties": {
        "connection_type": {
          "type": "string",
          "enum": ["local", "ant_plus", "bluetooth_le", "bluetooth", "wifi", "usb", "unknown"]
        },
        "ant_device_number": { "type": "integer", "minimum": 0 },
        "bluetooth_id": { "type": "string" }
      }
    },
    "CalibrationInfo": {
      "type": "object",
      "additionalProperties": false,
      "properties": {
        "calibration_factor": { "type": "number" },
        "last_calibrated": { "type": "string", "format": "date-time" },
        "auto_zero_enabled": { "type": "boolean" }
      }
    },
    "SportSegment": {
      "type": "object",
      "required": ["segment_id", "sport", "segment_index"],
      "additionalProperties": false,
      "properties": {
        "segment_id": { "type": "string" },
        "sport": { "$ref": "#/$defs/Sport" },
        "segment_index": { "type": "integer", "minimum": 0 },
        "started_at": { "type": "string", "format": "date-time" },
        "duration_sec": { "type": "number", "minimum": 0 },
        "distance_m": { "type": "number", "minimum": 0 },
        "exercise_ids": { "type": "array", "items": { "type": "string" } },
        "telemetry": { "$ref": "#/$defs/WorkoutTelemetry" },
        "transition": { "$ref": "#/$defs/TransitionData" },
        "notes": { "type": "string" }
      }
    },
    "TransitionData": {
      "type": "object",
      "required": ["transition_id", "from_sport", "to_sport"],
      "additionalProperties": false,
      "properties": {
        "transition_id": { "type": "string" },
        "from_sport": { "$ref": "#/$defs/Sport" },
        "to_sport": { "$ref": "#/$defs/Sport" },
        "duration_sec": { "type": "number", "minimum": 0 },
        "started_at": { "type": "string", "format": "date-time" },
        "heart_rate_avg": { "type": "integer", "minimum": 0 },
        "notes": { "type": "string" }
      }
    },
    "PersonalRecord": {
      "type": "object",
      "required": ["exercise_name", "record_type", "value", "achieved_at"],
      "additionalProperties": false,
      "properties": {
        "exercise_name": { "type": "string", "minLength": 1 },
        "record_type": {
          "type": "string",
          "enum": ["1rm", "max_weight_3rm", "max_weight_5rm", "max_weight_8rm", "max_weight_10rm", "max_weight",
                   "max_reps", "max_volume", "max_duration", "max_distance", "fastest_time"]
        },
        "value": { "type": "number" },
        "unit": { "type": "string" },
        "achieved_at": { "type": "string", "format": "date" },
        "workout_id": { "type": "string" },
        "notes": { "type": "string" }
      }
    },
    "BodyMeasurement": {
      "type": "object",
      "required": ["date"],
      "additionalProperties": false,
      "properties": {
        "date": { "type": "string", "format": "date" },
        "recorded_at": { "type": "string", "format": "date-time" },
        "weight_kg": { "type": "number", "exclusiveMinimum": 0 },
        "weight_lb": { "type": "number", "exclusiveMinimum": 0 },
        "body_fat_percent": { "type": "number", "minimum": 0, "maximum": 100 },
        "notes": { "type": "string" },
        "measurements": { "$ref": "#/$defs/BodyDimensions" }
      }
    },
    "BodyDimensions": {
      "type": "object",
      "additionalProperties": false,
      "properties": {
        "neck_cm": { "type": "number", "exclusiveMinimum": 0 },
        "shoulders_cm": { "type": "number", "exclusiveMinimum": 0 },
        "chest_cm": { "type": "number", "exclusiveMinimum": 0 },
        "waist_cm": { "type": "number", "exclusiveMinimum": 0 },
        "hips_cm": { "type": "number", "exclusiveMinimum": 0 },
        "bicep_left_cm": { "type": "number", "exclusiveMinimum": 0 },
        "bicep_right_cm": { "type": "number", "exclusiveMinimum": 0 },
        "forearm_left_cm": { "type": "number", "exclusiveMinimum": 0 },
        "forearm_right_cm": { "type": "number", "exclusiveMinimum": 0 },
        "thigh_left_cm": { "type": "number", "exclusiveMinimum": 0 },
        "thigh_right_cm": { "type": "number", "exclusiveMinimum": 0 },
        "calf_left_cm": { "type": "number", "exclusiveMinimum": 0 },
        "calf_right_cm": { "type": "number", "exclusiveMinimum": 0 }
      }
    }
  }
})json";

nlohmann::json load_embedded(const char* text, const char* name) {
    try {
        return nlohmann::json::parse(text);
    } catch (const std::exception& e) {
        throw std::logic_error(std::string("embedded schema '") + name + "' is not valid JSON: " + e.what());
    }
}

}  // namespace

const nlohmann::json& plan_schema() {
    static const nlohmann::json schema = load_embedded(kPlanSchemaV1, "pwf-v1");
    return schema;
}

const nlohmann::json& history_schema() {
    static const nlohmann::json schema = load_embedded(kHistorySchemaV1, "pwf-history-v1");
    return schema;
}

const nlohmann::json& schema_for(DocumentKind kind) {
    switch (kind) {
        case DocumentKind::Plan: return plan_schema();
        case DocumentKind::History: return history_schema();
    }
    throw std::logic_error("unknown document kind");
}

}  // namespace pwf
